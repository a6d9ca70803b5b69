#include <algorithm>
#include <cmath>
#include <glide/timing.hpp>
#include <memory>

namespace glide::timing
{

namespace
{

int sign_of(double v)
{
    return (v > 0.0) - (v < 0.0);
}

}  // anonymous namespace

Gravitate::Gravitate(TimingFunction orbitor, TimingFunction gravitator)
    : orbitor_(std::move(orbitor)), gravitator_(std::move(gravitator))
{
}

GravitateSection Gravitate::compute_section(double start) const
{
    GravitateSection section;
    section.start = start;
    section.end   = start;
    section.valid = true;

    int reference_sign = 0;

    // Integer stepping keeps the sample grid free of accumulated drift
    for (int i = 0;; ++i)
    {
        double p    = std::min(start + i * SAMPLE_STEP, 1.0);
        double diff = orbitor_(p) - gravitator_(p);
        int    sign = sign_of(diff);

        if (reference_sign == 0)
            reference_sign = sign;
        else if (sign != 0 && sign != reference_sign)
            break;   // curves crossed between the previous sample and p

        section.end       = p;
        section.max_delta = std::max(section.max_delta, std::abs(diff));

        if (!(p < 1.0))
            break;
    }

    return section;
}

double Gravitate::operator()(double progress)
{
    if (!section_.contains(progress))
    {
        section_ = compute_section(progress);
    }

    double o = orbitor_(progress);
    double g = gravitator_(progress);

    if (section_.max_delta == 0.0)
        return o;

    double pull = std::abs(o - g) / section_.max_delta;
    return o + (g - o) * pull;
}

TimingFunction gravitate(TimingFunction orbitor, TimingFunction gravitator)
{
    auto state = std::make_shared<Gravitate>(std::move(orbitor), std::move(gravitator));
    return [state](double progress) { return (*state)(progress); };
}

}   // namespace glide::timing
