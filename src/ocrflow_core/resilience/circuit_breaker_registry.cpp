#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"

namespace ocrflow_core {

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerSettings defaults, SteadyClock clock)
    : defaults_(defaults), clock_(std::move(clock)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = breakers_.find(name);
  if (it != breakers_.end()) {
    return it->second;
  }
  auto breaker = std::make_shared<CircuitBreaker>(name, defaults_, clock_);
  breakers_.emplace(name, breaker);
  return breaker;
}

std::vector<std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<CircuitBreaker>> out;
  out.reserve(breakers_.size());
  for (const auto &[name, breaker] : breakers_) {
    out.push_back(breaker);
  }
  return out;
}

}  // namespace ocrflow_core
