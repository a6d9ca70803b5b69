#include <chrono>
#include <glide/glide.hpp>
#include <thread>

using namespace glide;

int main()
{
    // Console output, plus GLIDE_LOG_LEVEL if the environment sets one
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().add_sink(sinks::file_sink("glide_example.log"));

    GLIDE_LOG_INFO("example", "Logger example starting up");

    // Animation internals log lifecycle at debug and every frame at trace
    TaskQueue queue;
    FrameLoop loop(queue, 10.0);

    AnimationConfig config;
    config.from             = 10.0;
    config.to               = -10.0;
    config.duration_seconds = 0.5;
    config.max_fps          = 5.0;
    config.on_update        = [](double state, double, double)
    { GLIDE_LOG_DEBUG("example", "value = {}", state); };
    config.enqueue = queue.scheduler();

    auto anim = animate(config);
    loop.run_until([&] { return anim->has_ended(); });

    // Sinks may be fed from several threads
    auto worker = [](int id)
    {
        for (int i = 0; i < 3; ++i)
        {
            GLIDE_LOG_DEBUG("worker", "Worker {} iteration {}", id, i);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);
    t1.join();
    t2.join();

    GLIDE_LOG_INFO("example", "Logger example completed");
    return 0;
}
