#pragma once

#include <chrono>
#include <functional>

namespace ocrflow_core {

// Injectable monotonic time source; tests substitute a manual clock.
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline SteadyClock default_steady_clock() {
  return [] { return std::chrono::steady_clock::now(); };
}

}  // namespace ocrflow_core
