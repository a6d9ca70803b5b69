#include <atomic>
#include <gtest/gtest.h>
#include <glide/task_queue.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace glide;

TEST(TaskQueue, RunsInPostOrder)
{
    TaskQueue        q;
    std::vector<int> order;

    q.post([&] { order.push_back(1); });
    q.post([&] { order.push_back(2); });
    q.post([&] { order.push_back(3); });
    EXPECT_EQ(q.size(), 3u);

    EXPECT_EQ(q.run_pending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueue, TasksPostedWhileRunningWaitForNextRound)
{
    TaskQueue q;
    int       runs = 0;

    std::function<void()> repost = [&]
    {
        ++runs;
        q.post(repost);
    };
    q.post(repost);

    EXPECT_EQ(q.run_pending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(q.size(), 1u);

    EXPECT_EQ(q.run_pending(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(TaskQueue, RunUntilIdleDrainsChains)
{
    TaskQueue q;
    int       remaining = 5;

    std::function<void()> step = [&]
    {
        if (--remaining > 0)
            q.post(step);
    };
    q.post(step);

    EXPECT_EQ(q.run_until_idle(), 5u);
    EXPECT_EQ(remaining, 0);
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueue, RunUntilIdleRespectsRoundLimit)
{
    TaskQueue q;

    std::function<void()> forever = [&] { q.post(forever); };
    q.post(forever);

    EXPECT_EQ(q.run_until_idle(3), 3u);
    EXPECT_EQ(q.size(), 1u);
    q.clear();
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueue, EmptyTaskIgnored)
{
    TaskQueue q;
    q.post(Task{});
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueue, ThrowingTaskKeepsRemainder)
{
    TaskQueue q;
    int       ran = 0;

    q.post([&] { ++ran; });
    q.post([] { throw std::runtime_error("task failed"); });
    q.post([&] { ++ran; });

    EXPECT_THROW(q.run_pending(), std::runtime_error);
    EXPECT_EQ(ran, 1);
    EXPECT_EQ(q.size(), 1u);

    q.run_pending();
    EXPECT_EQ(ran, 2);
}

TEST(TaskQueue, SchedulerPostsToQueue)
{
    TaskQueue q;
    bool      ran = false;

    Scheduler enqueue = q.scheduler();
    enqueue([&] { ran = true; });
    EXPECT_FALSE(ran);

    q.run_pending();
    EXPECT_TRUE(ran);
}

TEST(TaskQueue, PostFromOtherThreads)
{
    TaskQueue        q;
    std::atomic<int> ran{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < 100; ++i)
                    q.post([&] { ran++; });
            });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(q.run_pending(), 400u);
    EXPECT_EQ(ran.load(), 400);
}

TEST(SteadyClockSeconds, NonDecreasing)
{
    double a = steady_clock_seconds();
    double b = steady_clock_seconds();
    EXPECT_GE(b, a);
}
