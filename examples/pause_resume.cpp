#include <cstdio>
#include <glide/glide.hpp>

using namespace glide;

// Pauses halfway through, waits, then resumes; the printed progress picks up
// where it left off.
int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    TaskQueue queue;
    FrameLoop loop(queue, 20.0);

    AnimationConfig config;
    config.from             = 0.0;
    config.to               = 1.0;
    config.duration_seconds = 1.0;
    config.timing_function  = timing::gravitate(timing::ease_in(), timing::steps(8));
    config.on_update        = [](double state, double, double t)
    { std::printf("t=%.3f  state=%.3f\n", t, state); };
    config.on_pause  = [](double t) { std::printf("paused at %.3f\n", t); };
    config.on_resume = [](double t) { std::printf("resumed at %.3f\n", t); };
    config.enqueue   = queue.scheduler();

    Animation anim(config);
    anim.start();

    loop.run_until([] { return false; }, 10);
    anim.pause();
    loop.run_until([] { return false; }, 10);
    anim.resume();
    loop.run_until([&] { return anim.has_ended(); });

    return 0;
}
