#pragma once

#include <glide/animation.hpp>
#include <glide/task_queue.hpp>
#include <vector>

namespace glide::test
{

// Manually advanced clock plus a TaskQueue standing in for the frame tick.
struct FakeHost
{
    double    now = 0.0;
    TaskQueue queue;

    Clock clock()
    {
        return [this] { return now; };
    }

    // Advances the clock, then runs one round of queued ticks.
    size_t tick(double dt)
    {
        now += dt;
        return queue.run_pending();
    }

    AnimationConfig config(double from, double to, double duration)
    {
        AnimationConfig c;
        c.from                  = from;
        c.to                    = to;
        c.duration_seconds      = duration;
        c.relative_time_seconds = clock();
        c.enqueue               = queue.scheduler();
        return c;
    }
};

struct UpdateRecord
{
    double state;
    double state_progress;
    double time_progress;
};

// Collects on_update arguments.
struct UpdateLog
{
    std::vector<UpdateRecord> updates;

    auto sink()
    {
        return [this](double state, double state_progress, double time_progress)
        { updates.push_back({state, state_progress, time_progress}); };
    }

    size_t size() const { return updates.size(); }
    const UpdateRecord& back() const { return updates.back(); }
};

}   // namespace glide::test
