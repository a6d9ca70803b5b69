#include <benchmark/benchmark.h>
#include <glide/animation.hpp>
#include <glide/task_queue.hpp>
#include <glide/timing.hpp>

using namespace glide;

// ─── Timing function benchmarks ──────────────────────────────────────────────

static void BM_EaseInOut(benchmark::State& state)
{
    auto   f = timing::ease_in_out(0.5);
    double p = 0.0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(f(p));
        p = p >= 1.0 ? 0.0 : p + 0.001;
    }
}
BENCHMARK(BM_EaseInOut);

static void BM_FlipComposition(benchmark::State& state)
{
    auto   f = timing::flip_y(timing::flip_x(timing::ease_in()));
    double p = 0.0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(f(p));
        p = p >= 1.0 ? 0.0 : p + 0.001;
    }
}
BENCHMARK(BM_FlipComposition);

static void BM_CachedHit(benchmark::State& state)
{
    auto f = timing::cached(timing::ease_in_out());
    f(0.5);
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(f(0.5));
    }
}
BENCHMARK(BM_CachedHit);

// Monotonic queries at frame-sized steps: mostly section cache hits
static void BM_GravitateSweep(benchmark::State& state)
{
    const double step = 1.0 / static_cast<double>(state.range(0));
    for (auto _ : state)
    {
        auto f = timing::gravitate(timing::ease_in(), timing::ease_out());
        for (double p = 0.0; p <= 1.0; p += step)
            benchmark::DoNotOptimize(f(p));
    }
}
BENCHMARK(BM_GravitateSweep)->Arg(60)->Arg(240)->Unit(benchmark::kMicrosecond);

// ─── Engine tick throughput ──────────────────────────────────────────────────

static void BM_AnimationTick(benchmark::State& state)
{
    TaskQueue q;
    double    now = 0.0;

    AnimationConfig cfg;
    cfg.from                  = 0.0;
    cfg.to                    = 1.0;
    cfg.duration_seconds      = 1e9;
    cfg.timing_function       = timing::ease_in_out();
    cfg.on_update             = [](double v, double, double) { benchmark::DoNotOptimize(v); };
    cfg.relative_time_seconds = [&now] { return now; };
    cfg.enqueue               = q.scheduler();

    auto anim = animate(cfg);
    for (auto _ : state)
    {
        now += 0.016;
        q.run_pending();
    }
}
BENCHMARK(BM_AnimationTick);
