#include <chrono>
#include <gtest/gtest.h>
#include <glide/animation.hpp>
#include <glide/frame_loop.hpp>

using namespace glide;

TEST(FrameLoop, DefaultState)
{
    TaskQueue q;
    FrameLoop loop(q);
    EXPECT_DOUBLE_EQ(loop.target_fps(), 60.0);
    EXPECT_EQ(loop.mode(), FrameLoop::Mode::TargetFPS);
    EXPECT_EQ(loop.current_frame().number, 0u);
}

TEST(FrameLoop, IgnoresNonPositiveTargetFps)
{
    TaskQueue q;
    FrameLoop loop(q, 30.0);
    loop.set_target_fps(0.0);
    loop.set_target_fps(-5.0);
    EXPECT_DOUBLE_EQ(loop.target_fps(), 30.0);
    loop.set_target_fps(120.0);
    EXPECT_DOUBLE_EQ(loop.target_fps(), 120.0);
}

TEST(FrameLoop, FrameNumbersAdvance)
{
    TaskQueue q;
    FrameLoop loop(q, 60.0, FrameLoop::Mode::Uncapped);

    loop.run_frame();
    EXPECT_EQ(loop.current_frame().number, 0u);
    EXPECT_DOUBLE_EQ(loop.current_frame().dt, 0.0);

    loop.run_frame();
    loop.run_frame();
    EXPECT_EQ(loop.current_frame().number, 2u);
    EXPECT_GE(loop.current_frame().elapsed_seconds(), 0.0);

    loop.reset();
    EXPECT_EQ(loop.current_frame().number, 0u);
}

TEST(FrameLoop, EachFrameRunsOneRound)
{
    TaskQueue q;
    FrameLoop loop(q, 60.0, FrameLoop::Mode::Uncapped);
    int       runs = 0;

    std::function<void()> repost = [&]
    {
        ++runs;
        q.post(repost);
    };
    q.post(repost);

    EXPECT_EQ(loop.run_until([&] { return runs >= 4; }), 4u);
    EXPECT_EQ(runs, 4);
    q.clear();
}

TEST(FrameLoop, TargetFpsPacesFrames)
{
    TaskQueue q;
    FrameLoop loop(q, 100.0);

    auto begin = std::chrono::steady_clock::now();
    loop.run_until([] { return false; }, 5);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    // Five 10ms frames
    EXPECT_GE(elapsed, 0.045);
}

TEST(FrameLoop, DrivesAnimationToCompletion)
{
    TaskQueue q;
    FrameLoop loop(q, 240.0);
    int       updates = 0;
    int       ended   = 0;

    AnimationConfig cfg;
    cfg.from             = 0.0;
    cfg.to               = 1.0;
    cfg.duration_seconds = 0.05;
    cfg.on_update        = [&](double, double, double) { ++updates; };
    cfg.on_end           = [&] { ++ended; };
    cfg.enqueue          = q.scheduler();

    auto anim   = animate(cfg);
    auto frames = loop.run_until_idle(10000);

    EXPECT_TRUE(anim->has_ended());
    EXPECT_EQ(ended, 1);
    EXPECT_GE(updates, 2);
    EXPECT_GT(frames, 0u);
    EXPECT_LT(frames, 10000u);
}
