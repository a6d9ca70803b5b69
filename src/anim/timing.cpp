#include <cmath>
#include <glide/timing.hpp>
#include <memory>
#include <random>
#include <unordered_map>

namespace glide::timing
{

TimingFunction linear()
{
    return [](double progress) { return progress; };
}

TimingFunction cubic_bezier(double x1, double y1, double x2, double y2)
{
    const double strength1 = x1;
    const double strength2 = 1.0 - x2;

    return [=](double progress)
    {
        double delta1 = y1 - progress;
        double delta2 = y2 - progress;
        double inv    = 1.0 - progress;

        return progress + delta1 * strength1 * inv * inv + delta2 * strength2 * progress * progress;
    };
}

TimingFunction ease_in_out(double strength)
{
    return cubic_bezier(strength, 0.0, 1.0 - strength, 1.0);
}

TimingFunction ease_in(double strength)
{
    return cubic_bezier(strength, 0.0, 1.0, 1.0);
}

TimingFunction ease_out(double strength)
{
    return cubic_bezier(0.0, 0.0, 1.0 - strength, 1.0);
}

TimingFunction all_or_nothing(double threshold)
{
    return [threshold](double progress) { return progress >= threshold ? 1.0 : 0.0; };
}

TimingFunction steps(int count)
{
    if (count <= 0)
        return linear();

    const double n = static_cast<double>(count);
    return [n](double progress) { return std::floor(progress * n) / n; };
}

TimingFunction fixed(double value)
{
    return [value](double) { return value; };
}

TimingFunction flip_x(TimingFunction f)
{
    return [f = std::move(f)](double progress) { return f(1.0 - progress); };
}

TimingFunction flip_y(TimingFunction f)
{
    return [f = std::move(f)](double progress) { return 1.0 - f(progress); };
}

TimingFunction random()
{
    std::random_device rd;
    return random(rd());
}

TimingFunction random(uint32_t seed)
{
    struct Source
    {
        std::mt19937                           engine;
        std::uniform_real_distribution<double> dist{0.0, 1.0};
    };

    auto source = std::make_shared<Source>(Source{std::mt19937(seed)});
    return cached([source](double) { return source->dist(source->engine); });
}

TimingFunction cached(TimingFunction f)
{
    auto cache = std::make_shared<std::unordered_map<double, double>>();
    return [f = std::move(f), cache](double progress)
    {
        auto it = cache->find(progress);
        if (it != cache->end())
            return it->second;

        double value = f(progress);
        cache->emplace(progress, value);
        return value;
    };
}

}   // namespace glide::timing
