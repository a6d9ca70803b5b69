#pragma once

#include <cstdint>
#include <functional>

namespace glide
{

// Maps time-progress (normally in [0,1]) to state-progress. The result is not
// clamped; overshooting curves may leave [0,1].
using TimingFunction = std::function<double(double)>;

namespace timing
{

TimingFunction linear();

// Closed-form blend that pulls the linear curve toward y1 near the start and
// toward y2 near the end, weighted by x1 and (1 - x2):
//
//   p + (y1 - p) * x1 * (1 - p)^2 + (y2 - p) * (1 - x2) * p^2
//
// This approximates the shape of a CSS-style cubic bezier ease without a
// parametric solve. It is cheap and exact at the endpoints for the ease
// presets below, but it is not the same curve as a true bezier.
TimingFunction cubic_bezier(double x1, double y1, double x2, double y2);

TimingFunction ease_in_out(double strength = 0.5);
TimingFunction ease_in(double strength = 0.5);
TimingFunction ease_out(double strength = 0.5);

// Step function: 1.0 at or above threshold, 0.0 below.
TimingFunction all_or_nothing(double threshold = 0.5);

// Quantizes progress into `count` equal buckets. count <= 0 disables quantization.
TimingFunction steps(int count);

TimingFunction fixed(double value);

// f(1 - p)
TimingFunction flip_x(TimingFunction f);
// 1 - f(p)
TimingFunction flip_y(TimingFunction f);

// Uniform noise in [0,1), memoized per input so re-queries are stable.
TimingFunction random();
TimingFunction random(uint32_t seed);

// Memoizes f by exact input value. Copies of the returned function share one
// cache. Only effective when callers repeat bit-identical inputs.
TimingFunction cached(TimingFunction f);

// ─── Gravitate ──────────────────────────────────────────────────────────────

// Contiguous input range over which orbitor - gravitator keeps one sign,
// with the largest absolute divergence sampled inside it.
struct GravitateSection
{
    double start     = 0.0;
    double end       = 0.0;
    double max_delta = 0.0;
    bool   valid     = false;

    bool contains(double progress) const
    {
        return valid && progress >= start && progress <= end;
    }
};

// Attracts `orbitor` toward `gravitator` in proportion to how close the
// current divergence is to the section maximum. Keeps the last computed
// section, so it is stateful and must not be queried from several threads
// at once.
class Gravitate
{
   public:
    static constexpr double SAMPLE_STEP = 0.01;

    Gravitate(TimingFunction orbitor, TimingFunction gravitator);

    double operator()(double progress);

    const GravitateSection& section() const { return section_; }

    // Scans forward from `start` until the divergence sign flips or input
    // reaches 1.0.
    GravitateSection compute_section(double start) const;

   private:
    TimingFunction   orbitor_;
    TimingFunction   gravitator_;
    GravitateSection section_;
};

TimingFunction gravitate(TimingFunction orbitor, TimingFunction gravitator);

}   // namespace timing

}   // namespace glide
