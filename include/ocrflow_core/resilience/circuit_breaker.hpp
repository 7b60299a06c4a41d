#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/util/clock.hpp"

namespace ocrflow_core {

enum class BreakerState { CLOSED, OPEN, HALF_OPEN };

std::string to_string(BreakerState state);

struct CircuitBreakerSettings {
  int failure_threshold = 5;
  std::chrono::milliseconds reset_timeout{60000};
  std::chrono::milliseconds half_open_timeout{30000};
};

/**
 * @class CircuitBreaker
 * @brief Fails fast on a downstream call-site after repeated failures.
 *
 * closed: calls pass; failure_threshold consecutive failures open the circuit.
 * open: calls are rejected until reset_timeout has passed since the last
 *       failure, then the circuit goes half-open.
 * half-open: one probe at a time, and only once half_open_timeout has passed
 *       since the last failure. A successful probe closes the circuit, a
 *       failed one reopens it.
 *
 * half_open_timeout must not exceed reset_timeout. The open to half-open
 * transition only checks reset_timeout, so a longer half-open wait is never
 * observed.
 *
 * The breaker never retries. Thread-safe.
 */
class CircuitBreaker {
 public:
  CircuitBreaker(std::string name, CircuitBreakerSettings settings,
                 SteadyClock clock = default_steady_clock());

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  // True if a call may proceed now. In half-open this claims the probe slot.
  bool allow_request();
  void record_success();
  void record_failure();
  // Releases a claimed probe without judging the dependency (caller error).
  void record_neutral();

  /**
   * @brief Runs fn under the breaker.
   * @throws ServiceUnavailableError when the circuit rejects the call.
   *
   * Exceptions from fn are rethrown unchanged. InvalidInputError is the
   * caller's fault and does not count against the dependency.
   */
  template <typename Fn>
  auto execute(Fn &&fn) -> std::invoke_result_t<Fn &> {
    using Result = std::invoke_result_t<Fn &>;
    if (!allow_request()) {
      throw ServiceUnavailableError("Service '" + name_ + "' is temporarily unavailable (circuit " +
                                    to_string(state()) + ")");
    }
    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        record_success();
      } else {
        Result result = fn();
        record_success();
        return result;
      }
    } catch (const InvalidInputError &) {
      record_neutral();
      throw;
    } catch (...) {
      record_failure();
      throw;
    }
  }

  BreakerState state() const;
  int consecutive_failures() const;
  std::uint64_t trip_count() const;
  const std::string &name() const {
    return name_;
  }

 private:
  void open_locked(std::chrono::steady_clock::time_point now);

  const std::string name_;
  const CircuitBreakerSettings settings_;
  SteadyClock clock_;

  mutable std::mutex mutex_;
  BreakerState state_ = BreakerState::CLOSED;
  int consecutive_failures_ = 0;
  std::optional<std::chrono::steady_clock::time_point> last_failure_time_;
  bool probe_in_flight_ = false;
  std::uint64_t trips_ = 0;
};

}  // namespace ocrflow_core
