#include "inferguard/resilience/circuit_breaker.hpp"

namespace inferguard::resilience {

std::string_view circuit_state_name(const CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half_open";
  }
  return "closed";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, std::shared_ptr<common::Clock> clock)
    : options_(options), clock_(std::move(clock)) {}

bool CircuitBreaker::recovery_elapsed() const {
  if (!last_failure_time_.has_value()) {
    return true;
  }
  return clock_->now() - *last_failure_time_ > options_.recovery_timeout;
}

bool CircuitBreaker::can_attempt() {
  switch (state_) {
  case CircuitState::Closed:
    return true;
  case CircuitState::Open:
    if (!recovery_elapsed()) {
      return false;
    }
    state_ = CircuitState::HalfOpen;
    probe_in_flight_ = true;
    return true;
  case CircuitState::HalfOpen:
    if (probe_in_flight_) {
      return false;
    }
    probe_in_flight_ = true;
    return true;
  }
  return false;
}

bool CircuitBreaker::would_allow() const {
  switch (state_) {
  case CircuitState::Closed:
    return true;
  case CircuitState::Open:
    return recovery_elapsed();
  case CircuitState::HalfOpen:
    return !probe_in_flight_;
  }
  return false;
}

common::Clock::duration CircuitBreaker::remaining_open() const {
  if (state_ != CircuitState::Open || !last_failure_time_.has_value()) {
    return common::Clock::duration::zero();
  }
  const auto reopen_at = *last_failure_time_ + options_.recovery_timeout;
  const auto now = clock_->now();
  return reopen_at > now ? reopen_at - now : common::Clock::duration::zero();
}

void CircuitBreaker::record_success() {
  failure_count_ = 0;
  state_ = CircuitState::Closed;
  probe_in_flight_ = false;
  last_success_time_ = clock_->now();
}

void CircuitBreaker::record_failure() {
  ++failure_count_;
  last_failure_time_ = clock_->now();
  probe_in_flight_ = false;
  if (state_ == CircuitState::HalfOpen || failure_count_ >= options_.failure_threshold) {
    state_ = CircuitState::Open;
  }
}

void CircuitBreaker::reset() {
  state_ = CircuitState::Closed;
  failure_count_ = 0;
  probe_in_flight_ = false;
  last_failure_time_.reset();
}

} // namespace inferguard::resilience
