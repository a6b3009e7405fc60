#pragma once

#include <chrono>
#include <functional>

namespace proofline::workflow {

/// Blocking wait used for the post-top-up settlement delay.
using sleeper_t = std::function<void(std::chrono::milliseconds duration)>;

/// Sleeper that blocks the calling thread.
sleeper_t make_thread_sleeper();

}  // namespace proofline::workflow
