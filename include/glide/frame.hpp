#pragma once

#include <cstdint>

namespace glide
{

struct Frame
{
    double   elapsed_sec = 0.0;
    double   dt          = 0.0;
    uint64_t number      = 0;

    double   elapsed_seconds() const { return elapsed_sec; }
    double   delta_time() const { return dt; }
    uint64_t frame_number() const { return number; }
};

}  // namespace glide
