#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <glide/frame.hpp>
#include <glide/task_queue.hpp>

namespace glide
{

// Drives a TaskQueue as a display-refresh style scheduler: each frame pumps
// the tasks posted during the previous frame, then waits out the remainder
// of the frame budget.
class FrameLoop
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep + spin-wait to hit target FPS
        Uncapped,    // Run as fast as possible
    };

    explicit FrameLoop(TaskQueue& queue, double target_fps = 60.0, Mode mode = Mode::TargetFPS);

    // Ignored unless fps > 0
    void   set_target_fps(double fps);
    double target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Runs one frame. Returns the number of tasks run.
    size_t run_frame();

    // Runs frames until `done` returns true or max_frames elapse. Returns the
    // number of frames run.
    uint64_t run_until(const std::function<bool()>& done, uint64_t max_frames = UINT64_MAX);

    // Runs frames until the queue is empty.
    uint64_t run_until_idle(uint64_t max_frames = UINT64_MAX);

    void reset();

    const Frame& current_frame() const { return frame_; }

    // Rolling-window frame timing
    struct FrameStats
    {
        double   max_frame_time_ms  = 0.0;
        double   avg_frame_time_ms  = 0.0;
        uint32_t hitch_count        = 0;   // frames > 2x target in window
        uint64_t window_frame_count = 0;
    };
    FrameStats frame_stats() const { return stats_; }

   private:
    using SteadyClock = std::chrono::steady_clock;
    using TimePoint   = SteadyClock::time_point;
    using Duration    = std::chrono::duration<double>;

    TaskQueue& queue_;
    double     target_fps_ = 60.0;
    Mode       mode_       = Mode::TargetFPS;

    TimePoint start_time_;
    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_ = true;

    Frame frame_;

    static constexpr uint64_t STATS_WINDOW_FRAMES = 600;   // ~10s at 60fps
    FrameStats                stats_;
    double                    max_dt_in_window_  = 0.0;
    double                    dt_sum_in_window_  = 0.0;
    uint32_t                  hitches_in_window_ = 0;
    uint64_t                  window_counter_    = 0;

    void begin_frame();
    void end_frame();
    void update_stats(double dt_ms);
};

}   // namespace glide
