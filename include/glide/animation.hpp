#pragma once

#include <exception>
#include <functional>
#include <future>
#include <glide/task_queue.hpp>
#include <glide/timing.hpp>
#include <memory>
#include <optional>
#include <stdexcept>

namespace glide
{

// Rejection value of the completion future when an animation is canceled.
class AnimationCanceled : public std::runtime_error
{
   public:
    AnimationCanceled() : std::runtime_error("animation canceled") {}
};

struct AnimationConfig
{
    double from             = 0.0;
    double to               = 0.0;
    double duration_seconds = 0.0;   // <= 0 completes on start

    // Start progress between 0.0 and 1.0
    double progress = 0.0;

    TimingFunction timing_function;   // empty = linear

    // Caps on_update calls per second. Unset or <= 0 disables the cap.
    std::optional<double> max_fps;

    using UpdateFn = std::function<void(double state, double state_progress, double time_progress)>;

    std::function<void()>                     on_start;
    UpdateFn                                  on_update;   // required
    std::function<void(double time_progress)> on_pause;
    std::function<void(double time_progress)> on_resume;
    std::function<void()>                     on_end;
    std::function<void()>                     on_cancel;

    // Monotonic seconds. Defaults to steady_clock_seconds().
    Clock relative_time_seconds;

    // Runs a task once, later, never from inside the call. Defaults to
    // posting on TaskQueue::main().
    Scheduler enqueue;
};

// Interpolates one value from `from` to `to` over `duration_seconds`.
//
//   Idle -> Running <-> Paused -> Ended
//   (any non-terminal)         -> Canceled
//
// Every lifecycle call that does not fit the current state is a silent no-op.
// Not thread-safe: all calls, and the scheduler's tasks, must run on one
// thread. An animation must not be destroyed from inside its own callbacks;
// ticks still queued after destruction are discarded.
//
// If a callback throws, the animation becomes terminal without calling
// on_cancel, the completion future is settled with that exception, and the
// exception propagates to the caller.
class Animation
{
   public:
    explicit Animation(AnimationConfig config);
    ~Animation() = default;

    Animation(const Animation&)            = delete;
    Animation& operator=(const Animation&) = delete;

    bool is_running() const;
    bool has_started() const { return start_time_.has_value(); }
    bool is_paused() const { return pause_time_.has_value(); }
    bool has_ended() const { return end_time_.has_value(); }
    bool is_canceled() const { return cancel_time_.has_value(); }

    // Progress accumulated up to the last pause (1.0 once ended).
    double time_progress() const { return time_progress_; }

    void start();
    void pause();
    void resume();
    void end();
    void cancel();

    // Settles when the animation ends (value) or is canceled (AnimationCanceled).
    // Runs after on_end / on_cancel. All calls share one settlement.
    std::shared_future<void> promise();

   private:
    void   handler(std::optional<double> time_progress = std::nullopt);
    void   schedule_handler_call();
    void   render(double time_progress);
    double now();
    double elapsed_progress(double current_time) const;
    // True from the moment end() begins its final frame
    bool   is_terminal() const { return ending_ || has_ended() || is_canceled(); }

    template <typename Fn>
    void guarded(Fn&& fn);
    void fail(std::exception_ptr error);
    void settle(std::exception_ptr error);

    AnimationConfig config_;
    Clock           clock_;
    Scheduler       enqueue_;

    std::optional<double> min_handler_interval_;
    std::optional<double> last_handler_call_time_;
    double                last_clock_reading_ = 0.0;
    bool                  tick_scheduled_     = false;
    bool                  ending_             = false;

    std::optional<double> start_time_;
    std::optional<double> pause_time_;
    std::optional<double> resume_time_;
    std::optional<double> end_time_;
    std::optional<double> cancel_time_;

    double time_progress_ = 0.0;

    std::optional<std::promise<void>> completion_;
    std::shared_future<void>          completion_future_;
    std::exception_ptr                failure_;

    // Queued ticks hold a weak reference; expiry means the animation is gone
    std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

// Constructs an animation and starts it unless auto_start is false.
std::unique_ptr<Animation> animate(AnimationConfig config, bool auto_start = true);

}   // namespace glide
