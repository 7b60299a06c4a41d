#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ocrflow_core/resilience/circuit_breaker.hpp"

namespace ocrflow_core {

// Call-site names used across the service.
inline constexpr const char *RASTERIZER_BREAKER = "rasterizer";
inline constexpr const char *PROCESSING_AGENT_BREAKER = "processing_agent";

// One breaker per call-site, shared for the life of the process.
class CircuitBreakerRegistry {
 public:
  explicit CircuitBreakerRegistry(CircuitBreakerSettings defaults,
                                  SteadyClock clock = default_steady_clock());

  std::shared_ptr<CircuitBreaker> get(const std::string &name);
  std::vector<std::shared_ptr<CircuitBreaker>> all() const;

 private:
  CircuitBreakerSettings defaults_;
  SteadyClock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace ocrflow_core
