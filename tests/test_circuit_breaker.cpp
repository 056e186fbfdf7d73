#include "test_framework.hpp"

#include "inferguard/resilience/circuit_breaker.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using inferguard::resilience::CircuitBreaker;
using inferguard::resilience::CircuitBreakerOptions;
using inferguard::resilience::CircuitState;
using inferguard::testing::ManualClock;

CircuitBreaker open_breaker(const std::shared_ptr<ManualClock> &clock) {
  CircuitBreaker breaker(CircuitBreakerOptions{.failure_threshold = 3,
                                               .recovery_timeout = std::chrono::seconds(60)},
                         clock);
  for (int i = 0; i < 3; ++i) {
    breaker.record_failure();
  }
  return breaker;
}

} // namespace

void register_circuit_breaker_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"breaker_opens_at_threshold", [] {
                     auto clock = std::make_shared<ManualClock>();
                     CircuitBreaker breaker({.failure_threshold = 3}, clock);
                     breaker.record_failure();
                     breaker.record_failure();
                     require(breaker.state() == CircuitState::Closed, "below threshold stays closed");
                     require(breaker.can_attempt(), "closed admits");
                     breaker.record_failure();
                     require(breaker.state() == CircuitState::Open, "threshold opens");
                     require(breaker.failure_count() == 3, "failure count");
                     require(!breaker.can_attempt(), "open refuses");
                     require(breaker.last_failure_time() == clock->now(), "failure stamped");
                   }});

  tests.push_back({"breaker_success_resets_consecutive_count", [] {
                     auto clock = std::make_shared<ManualClock>();
                     CircuitBreaker breaker({.failure_threshold = 3}, clock);
                     breaker.record_failure();
                     breaker.record_failure();
                     breaker.record_success();
                     breaker.record_failure();
                     breaker.record_failure();
                     require(breaker.state() == CircuitState::Closed,
                             "failures must be consecutive to open");
                     require(breaker.last_success_time().has_value(), "success stamped");
                   }});

  tests.push_back({"breaker_half_open_after_recovery_timeout", [] {
                     auto clock = std::make_shared<ManualClock>();
                     auto breaker = open_breaker(clock);
                     require(breaker.remaining_open() == 60s, "full recovery window remaining");
                     clock->advance(60s);
                     require(!breaker.would_allow(), "timeout must be strictly exceeded");
                     require(!breaker.can_attempt(), "still open at exactly the timeout");
                     clock->advance(1ms);
                     require(breaker.would_allow(), "probe available");
                     require(breaker.state() == CircuitState::Open, "would_allow does not transition");
                     require(breaker.can_attempt(), "first call after timeout is the probe");
                     require(breaker.state() == CircuitState::HalfOpen, "probe flips to half open");
                     require(breaker.probe_in_flight(), "probe outstanding");
                   }});

  tests.push_back({"breaker_half_open_admits_single_probe", [] {
                     auto clock = std::make_shared<ManualClock>();
                     auto breaker = open_breaker(clock);
                     clock->advance(61s);
                     require(breaker.can_attempt(), "probe granted");
                     require(!breaker.can_attempt(), "second caller refused while probing");
                     require(!breaker.would_allow(), "would_allow agrees");
                   }});

  tests.push_back({"breaker_probe_failure_reopens", [] {
                     auto clock = std::make_shared<ManualClock>();
                     auto breaker = open_breaker(clock);
                     clock->advance(61s);
                     require(breaker.can_attempt(), "probe granted");
                     breaker.record_failure();
                     require(breaker.state() == CircuitState::Open, "failed probe reopens");
                     require(!breaker.can_attempt(), "new recovery window starts");
                     clock->advance(61s);
                     require(breaker.can_attempt(), "next probe after another window");
                   }});

  tests.push_back({"breaker_probe_success_closes", [] {
                     auto clock = std::make_shared<ManualClock>();
                     auto breaker = open_breaker(clock);
                     clock->advance(61s);
                     require(breaker.can_attempt(), "probe granted");
                     breaker.record_success();
                     require(breaker.state() == CircuitState::Closed, "successful probe closes");
                     require(breaker.failure_count() == 0, "failures cleared");
                     require(breaker.can_attempt() && breaker.can_attempt(), "closed admits freely");
                   }});

  tests.push_back({"breaker_reset_forces_closed", [] {
                     auto clock = std::make_shared<ManualClock>();
                     auto breaker = open_breaker(clock);
                     breaker.reset();
                     require(breaker.state() == CircuitState::Closed, "reset closes");
                     require(breaker.failure_count() == 0, "reset clears failures");
                     require(!breaker.last_failure_time().has_value(), "reset clears failure time");
                     require(breaker.remaining_open() == 0s, "nothing remaining");
                   }});

  tests.push_back({"breaker_state_names", [] {
                     using inferguard::resilience::circuit_state_name;
                     require(circuit_state_name(CircuitState::Closed) == "closed", "closed");
                     require(circuit_state_name(CircuitState::Open) == "open", "open");
                     require(circuit_state_name(CircuitState::HalfOpen) == "half_open", "half_open");
                   }});
}
