#pragma once
#include <chrono>
#include <functional>
#include <thread>

namespace wam {

// Sleep and monotonic clock behind std::function so retry and polling loops
// can run against a simulated clock.
struct Timing {
  using Clock = std::chrono::steady_clock;

  std::function<void(std::chrono::milliseconds)> sleep =
    [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  std::function<Clock::time_point()> now = [] { return Clock::now(); };
};

} // namespace wam
