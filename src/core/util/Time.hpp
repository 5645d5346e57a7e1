#pragma once
#include <chrono>
#include <cstdint>

namespace wam {

// Wall-clock epoch milliseconds; used for persisted timestamps and
// original-upload path suffixes.
inline int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace wam
