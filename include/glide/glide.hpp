#pragma once

#include <glide/animation.hpp>
#include <glide/frame.hpp>
#include <glide/frame_loop.hpp>
#include <glide/fwd.hpp>
#include <glide/logger.hpp>
#include <glide/task_queue.hpp>
#include <glide/timing.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   glide::TaskQueue queue;
//   glide::FrameLoop loop(queue, 60.0);
//
//   auto anim = glide::animate({.from = 0.0,
//                               .to = 100.0,
//                               .duration_seconds = 0.5,
//                               .timing_function = glide::timing::ease_out(),
//                               .on_update = [](double v, double, double) { ... },
//                               .enqueue = queue.scheduler()});
//
//   loop.run_until([&] { return anim->has_ended(); });
