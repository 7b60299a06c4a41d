#include "ocrflow_core/resilience/circuit_breaker.hpp"

#include <iostream>
#include <stdexcept>

namespace ocrflow_core {

std::string to_string(BreakerState state) {
  switch (state) {
    case BreakerState::CLOSED: return "closed";
    case BreakerState::OPEN: return "open";
    case BreakerState::HALF_OPEN: return "half-open";
  }
  return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerSettings settings,
                               SteadyClock clock)
    : name_(std::move(name)), settings_(settings), clock_(std::move(clock)) {
  if (settings_.failure_threshold < 1) {
    throw std::invalid_argument("CircuitBreaker failure_threshold must be at least 1");
  }
  if (!clock_) {
    throw std::invalid_argument("CircuitBreaker requires a clock");
  }
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();

  switch (state_) {
    case BreakerState::CLOSED:
      return true;

    case BreakerState::OPEN:
      if (last_failure_time_ && now - *last_failure_time_ >= settings_.reset_timeout) {
        std::cout << "[CircuitBreaker:" << name_ << "] reset timeout elapsed, half-open"
                  << std::endl;
        state_ = BreakerState::HALF_OPEN;
        probe_in_flight_ = true;
        return true;
      }
      return false;

    case BreakerState::HALF_OPEN:
      if (probe_in_flight_) {
        return false;
      }
      if (last_failure_time_ && now - *last_failure_time_ < settings_.half_open_timeout) {
        return false;
      }
      probe_in_flight_ = true;
      return true;
  }
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == BreakerState::HALF_OPEN) {
    std::cout << "[CircuitBreaker:" << name_ << "] probe succeeded, closing circuit" << std::endl;
  }
  state_ = BreakerState::CLOSED;
  consecutive_failures_ = 0;
  probe_in_flight_ = false;
}

void CircuitBreaker::record_failure() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();
  consecutive_failures_++;
  last_failure_time_ = now;

  if (state_ == BreakerState::HALF_OPEN) {
    open_locked(now);
    return;
  }
  if (state_ == BreakerState::CLOSED && consecutive_failures_ >= settings_.failure_threshold) {
    open_locked(now);
  }
}

void CircuitBreaker::record_neutral() {
  std::lock_guard<std::mutex> lock(mutex_);
  probe_in_flight_ = false;
}

void CircuitBreaker::open_locked(std::chrono::steady_clock::time_point now) {
  state_ = BreakerState::OPEN;
  probe_in_flight_ = false;
  last_failure_time_ = now;
  trips_++;
  std::cerr << "[CircuitBreaker:" << name_ << "] circuit opened after " << consecutive_failures_
            << " consecutive failures" << std::endl;
}

BreakerState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int CircuitBreaker::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consecutive_failures_;
}

std::uint64_t CircuitBreaker::trip_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trips_;
}

}  // namespace ocrflow_core
