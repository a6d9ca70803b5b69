#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace glide
{

using Task      = std::function<void()>;
using Clock     = std::function<double()>;
using Scheduler = std::function<void(Task)>;

// Seconds on std::chrono::steady_clock since an arbitrary epoch.
double steady_clock_seconds();

// FIFO of deferred tasks pumped by the host. post() may be called from any
// thread; tasks run on whichever thread calls run_pending().
class TaskQueue
{
   public:
    TaskQueue()  = default;
    ~TaskQueue() = default;

    TaskQueue(const TaskQueue&)            = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Process-wide queue used when an animation is given no scheduler.
    static TaskQueue& main();

    void post(Task task);

    // Runs the tasks that were queued when the call began. Tasks posted while
    // running are left for the next call, so a task that re-posts itself runs
    // once per call. Returns the number of tasks run.
    size_t run_pending();

    // Calls run_pending() until the queue drains or max_rounds is reached.
    // Returns the total number of tasks run.
    size_t run_until_idle(size_t max_rounds = 100000);

    size_t size() const;
    bool   empty() const;
    void   clear();

    // Scheduler bound to this queue. The queue must outlive every animation
    // holding the returned function.
    Scheduler scheduler();

   private:
    mutable std::mutex mutex_;
    std::deque<Task>   tasks_;
};

}   // namespace glide
