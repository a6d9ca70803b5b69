#include <algorithm>
#include <glide/animation.hpp>
#include <glide/logger.hpp>
#include <string>
#include <utility>

namespace glide
{

namespace
{

std::string describe(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "non-standard exception";
    }
}

}  // anonymous namespace

Animation::Animation(AnimationConfig config) : config_(std::move(config))
{
    clock_ = config_.relative_time_seconds ? config_.relative_time_seconds
                                           : Clock(steady_clock_seconds);
    enqueue_ = config_.enqueue ? config_.enqueue : TaskQueue::main().scheduler();

    if (config_.max_fps && *config_.max_fps > 0.0)
    {
        min_handler_interval_ = 1.0 / *config_.max_fps;
    }

    time_progress_ = config_.progress;
}

bool Animation::is_running() const
{
    return has_started() && !has_ended() && !is_paused() && !is_canceled();
}

// ─── Failure handling ───────────────────────────────────────────────────────

template <typename Fn>
void Animation::guarded(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (...)
    {
        fail(std::current_exception());
        throw;
    }
}

void Animation::fail(std::exception_ptr error)
{
    // Nested guarded() frames see the same exception again
    if (failure_ && failure_ == error)
        return;

    GLIDE_LOG_ERROR("animation", "callback threw: {}", describe(error));

    failure_ = error;
    if (!has_ended() && !is_canceled())
    {
        cancel_time_ = last_clock_reading_;
    }
    settle(error);
}

void Animation::settle(std::exception_ptr error)
{
    if (!completion_)
        return;

    if (error)
        completion_->set_exception(error);
    else
        completion_->set_value();
    completion_.reset();
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

void Animation::start()
{
    if (has_started() || is_terminal())
        return;

    start_time_ = now();
    GLIDE_LOG_DEBUG("animation", "start at progress {}", time_progress_);

    if (config_.on_start)
    {
        guarded(config_.on_start);
        // Re-read so a slow on_start does not eat into the first segment
        start_time_ = now();
    }

    // Render the initial state and start the loop
    handler(time_progress_);
}

void Animation::pause()
{
    if (is_paused() || is_terminal())
        return;

    double current_time = now();
    time_progress_      = std::min(time_progress_ + elapsed_progress(current_time), 1.0);

    pause_time_ = current_time;
    resume_time_.reset();
    GLIDE_LOG_DEBUG("animation", "pause at progress {}", time_progress_);

    if (config_.on_pause)
        guarded([&] { config_.on_pause(time_progress_); });
}

void Animation::resume()
{
    if (!is_paused() || is_terminal())
        return;

    resume_time_ = now();
    pause_time_.reset();
    GLIDE_LOG_DEBUG("animation", "resume at progress {}", time_progress_);

    if (config_.on_resume)
    {
        guarded([&] { config_.on_resume(time_progress_); });
        resume_time_ = now();
    }

    handler(time_progress_);
}

void Animation::end()
{
    if (is_terminal())
        return;
    ending_ = true;

    // Final frame at exactly 1.0 so on_update always observes the target.
    // Lifecycle calls made from inside it are ignored.
    render(1.0);

    time_progress_ = 1.0;
    end_time_      = now();
    GLIDE_LOG_DEBUG("animation", "end");

    if (config_.on_end)
        guarded(config_.on_end);

    settle(nullptr);
}

void Animation::cancel()
{
    if (is_terminal())
        return;

    cancel_time_ = now();
    GLIDE_LOG_DEBUG("animation", "cancel at progress {}", time_progress_);

    if (config_.on_cancel)
        guarded(config_.on_cancel);

    settle(std::make_exception_ptr(AnimationCanceled{}));
}

std::shared_future<void> Animation::promise()
{
    if (completion_future_.valid())
        return completion_future_;

    std::promise<void> p;
    completion_future_ = p.get_future().share();

    if (has_ended() && !failure_)
    {
        p.set_value();
    }
    else if (has_ended() || is_canceled())
    {
        p.set_exception(failure_ ? failure_ : std::make_exception_ptr(AnimationCanceled{}));
    }
    else
    {
        completion_ = std::move(p);
    }
    return completion_future_;
}

// ─── Loop ───────────────────────────────────────────────────────────────────

void Animation::handler(std::optional<double> time_progress)
{
    // Pause, end and cancel stop the loop here
    if (!is_running())
        return;

    double current_time = now();

    if (min_handler_interval_ && last_handler_call_time_)
    {
        double since_last = current_time - *last_handler_call_time_;
        if (since_last < *min_handler_interval_)
        {
            GLIDE_LOG_TRACE("animation", "throttled, {}s since last frame", since_last);
            schedule_handler_call();
            return;
        }
    }

    last_handler_call_time_ = current_time;

    double progress = time_progress ? *time_progress
                                    : time_progress_ + elapsed_progress(current_time);

    if (progress >= 1.0 || config_.duration_seconds <= 0.0)
    {
        end();
        return;
    }

    render(progress);

    // on_update may have paused or canceled us
    if (is_running())
        schedule_handler_call();
}

void Animation::schedule_handler_call()
{
    // At most one tick in flight
    if (tick_scheduled_)
        return;
    tick_scheduled_ = true;

    std::weak_ptr<char> alive = alive_;
    try
    {
        enqueue_(
            [this, alive]()
            {
                if (alive.expired())
                    return;
                tick_scheduled_ = false;
                handler();
            });
    }
    catch (...)
    {
        // Nothing was queued, so a later resume() must be able to re-arm
        tick_scheduled_ = false;
        throw;
    }
}

void Animation::render(double time_progress)
{
    time_progress = std::clamp(time_progress, 0.0, 1.0);

    double state_progress =
        config_.timing_function ? config_.timing_function(time_progress) : time_progress;

    double state = config_.from + (config_.to - config_.from) * state_progress;

    GLIDE_LOG_TRACE("animation", "render {} (state {}, time {})", state, state_progress, time_progress);

    if (config_.on_update)
        guarded([&] { config_.on_update(state, state_progress, time_progress); });
}

double Animation::now()
{
    last_clock_reading_ = clock_();
    return last_clock_reading_;
}

double Animation::elapsed_progress(double current_time) const
{
    if (config_.duration_seconds <= 0.0)
        return 0.0;

    // The running segment began at the later of start and the last resume
    std::optional<double> run_start = start_time_;
    if (resume_time_ && (!run_start || *resume_time_ > *run_start))
        run_start = resume_time_;

    if (!run_start)
        return 0.0;

    return (current_time - *run_start) / config_.duration_seconds;
}

// ─── Convenience ────────────────────────────────────────────────────────────

std::unique_ptr<Animation> animate(AnimationConfig config, bool auto_start)
{
    auto animation = std::make_unique<Animation>(std::move(config));
    if (auto_start)
    {
        animation->start();
    }
    return animation;
}

}   // namespace glide
