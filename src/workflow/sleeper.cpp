#include <proofline/workflow/sleeper.hpp>

#include <thread>

namespace proofline::workflow {

sleeper_t make_thread_sleeper() {
  return [](const std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
  };
}

}  // namespace proofline::workflow
