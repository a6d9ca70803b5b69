#include <glide/frame_loop.hpp>
#include <glide/logger.hpp>
#include <thread>

namespace glide
{

FrameLoop::FrameLoop(TaskQueue& queue, double target_fps, Mode mode)
    : queue_(queue), target_fps_(target_fps), mode_(mode)
{
    reset();
}

void FrameLoop::set_target_fps(double fps)
{
    if (fps > 0.0)
    {
        target_fps_ = fps;
    }
}

size_t FrameLoop::run_frame()
{
    begin_frame();
    size_t ran = queue_.run_pending();
    end_frame();
    return ran;
}

uint64_t FrameLoop::run_until(const std::function<bool()>& done, uint64_t max_frames)
{
    uint64_t frames = 0;
    while (frames < max_frames && !done())
    {
        run_frame();
        ++frames;
    }
    return frames;
}

uint64_t FrameLoop::run_until_idle(uint64_t max_frames)
{
    return run_until([this] { return queue_.empty(); }, max_frames);
}

void FrameLoop::begin_frame()
{
    frame_start_ = SteadyClock::now();

    if (first_frame_)
    {
        first_frame_       = false;
        start_time_        = frame_start_;
        last_frame_start_  = frame_start_;
        frame_.dt          = 0.0;
        frame_.elapsed_sec = 0.0;
        frame_.number      = 0;
        return;
    }

    Duration elapsed_since_start = frame_start_ - start_time_;
    Duration dt_duration         = frame_start_ - last_frame_start_;
    last_frame_start_            = frame_start_;

    frame_.dt          = dt_duration.count();
    frame_.elapsed_sec = elapsed_since_start.count();
    frame_.number++;

    update_stats(frame_.dt * 1000.0);
}

void FrameLoop::end_frame()
{
    if (mode_ != Mode::TargetFPS || target_fps_ <= 0.0)
        return;

    Duration target_frame_time{1.0 / target_fps_};
    Duration frame_duration = SteadyClock::now() - frame_start_;

    if (frame_duration >= target_frame_time)
        return;

    // Sleep for most of the remaining time (leave 1ms for spin-wait)
    Duration remaining  = target_frame_time - frame_duration;
    auto     sleep_time = remaining - Duration{0.001};
    if (sleep_time.count() > 0.0)
    {
        std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::microseconds>(sleep_time));
    }

    auto deadline = frame_start_ + std::chrono::duration_cast<SteadyClock::duration>(target_frame_time);
    while (SteadyClock::now() < deadline)
    {
        // Busy wait
    }
}

void FrameLoop::reset()
{
    first_frame_       = true;
    frame_             = Frame{};
    stats_             = FrameStats{};
    max_dt_in_window_  = 0.0;
    dt_sum_in_window_  = 0.0;
    hitches_in_window_ = 0;
    window_counter_    = 0;
}

void FrameLoop::update_stats(double dt_ms)
{
    if (dt_ms > max_dt_in_window_)
        max_dt_in_window_ = dt_ms;
    dt_sum_in_window_ += dt_ms;
    window_counter_++;

    double target_ms = (target_fps_ > 0.0) ? (1000.0 / target_fps_) : 16.667;
    if (mode_ == Mode::TargetFPS && dt_ms > target_ms * 2.0)
    {
        hitches_in_window_++;
        GLIDE_LOG_DEBUG("frame_loop",
                        "Frame {} hitch: {}ms (target: {}ms)",
                        frame_.number,
                        dt_ms,
                        target_ms);
    }

    if (window_counter_ >= STATS_WINDOW_FRAMES)
    {
        stats_.max_frame_time_ms  = max_dt_in_window_;
        stats_.avg_frame_time_ms  = dt_sum_in_window_ / static_cast<double>(window_counter_);
        stats_.hitch_count        = hitches_in_window_;
        stats_.window_frame_count = window_counter_;

        if (hitches_in_window_ > 0)
        {
            GLIDE_LOG_INFO("frame_loop",
                           "Stats ({} frames): avg={}ms max={}ms hitches={}",
                           window_counter_,
                           stats_.avg_frame_time_ms,
                           stats_.max_frame_time_ms,
                           hitches_in_window_);
        }

        max_dt_in_window_  = 0.0;
        dt_sum_in_window_  = 0.0;
        hitches_in_window_ = 0;
        window_counter_    = 0;
    }
}

}   // namespace glide
