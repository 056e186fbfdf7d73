#pragma once

#include "inferguard/common/clock.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace inferguard::resilience {

enum class CircuitState { Closed, Open, HalfOpen };

[[nodiscard]] std::string_view circuit_state_name(CircuitState state);

struct CircuitBreakerOptions {
  std::uint32_t failure_threshold = 3;
  std::chrono::seconds recovery_timeout{60};
};

/// Per-provider failure/recovery state machine. Pure state, no I/O and no locking:
/// callers serialize access (the orchestrator holds the provider's mutex).
///
/// CLOSED -> OPEN after `failure_threshold` consecutive failures. OPEN -> HALF_OPEN on the
/// first can_attempt() once `recovery_timeout` has elapsed since the last failure; that
/// call is the single probe. The probe's record_success() closes the circuit and its
/// record_failure() reopens it. Further can_attempt() calls while the probe is
/// outstanding are refused.
class CircuitBreaker {
public:
  explicit CircuitBreaker(CircuitBreakerOptions options = {},
                          std::shared_ptr<common::Clock> clock = common::default_clock());

  [[nodiscard]] bool can_attempt();
  void record_success();
  void record_failure();
  void reset();

  /// Whether can_attempt() would currently succeed, without claiming the probe.
  [[nodiscard]] bool would_allow() const;
  /// Time left before an OPEN circuit admits its probe; zero otherwise.
  [[nodiscard]] common::Clock::duration remaining_open() const;

  [[nodiscard]] CircuitState state() const { return state_; }
  [[nodiscard]] std::uint32_t failure_count() const { return failure_count_; }
  [[nodiscard]] bool probe_in_flight() const { return probe_in_flight_; }
  [[nodiscard]] std::optional<common::Clock::time_point> last_failure_time() const {
    return last_failure_time_;
  }
  [[nodiscard]] std::optional<common::Clock::time_point> last_success_time() const {
    return last_success_time_;
  }

private:
  [[nodiscard]] bool recovery_elapsed() const;

  CircuitBreakerOptions options_;
  std::shared_ptr<common::Clock> clock_;
  CircuitState state_ = CircuitState::Closed;
  std::uint32_t failure_count_ = 0;
  bool probe_in_flight_ = false;
  std::optional<common::Clock::time_point> last_failure_time_;
  std::optional<common::Clock::time_point> last_success_time_;
};

} // namespace inferguard::resilience
