#include <cstdio>
#include <glide/glide.hpp>

using namespace glide;

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().configure_from_env();

    TaskQueue queue;
    FrameLoop loop(queue, 30.0);

    auto anim = animate({.from             = 50.0,
                         .to               = 275.0,
                         .duration_seconds = 1.5,
                         .timing_function  = timing::ease_in_out(1.0),
                         .on_start         = [] { GLIDE_LOG_INFO("example", "start"); },
                         .on_update        = [](double state, double, double time_progress)
                         { std::printf("%6.3f  %8.3f\n", time_progress, state); },
                         .on_end           = [] { GLIDE_LOG_INFO("example", "end"); },
                         .enqueue          = queue.scheduler()});

    auto done = anim->promise();
    uint64_t frames = loop.run_until(
        [&] { return done.wait_for(std::chrono::seconds(0)) == std::future_status::ready; });

    GLIDE_LOG_INFO("example", "finished after {} frames", frames);
    return 0;
}
