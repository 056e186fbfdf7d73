#include "test_framework.hpp"

#include "inferguard/resilience/backoff.hpp"

#include <cmath>

namespace {

using inferguard::resilience::BackoffOptions;
using inferguard::resilience::ExponentialBackoff;

bool near(double lhs, double rhs) { return std::fabs(lhs - rhs) < 1e-9; }

} // namespace

void register_backoff_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;

  tests.push_back({"backoff_without_jitter_doubles_then_saturates", [] {
                     ExponentialBackoff backoff(
                         BackoffOptions{.base_seconds = 1.0, .multiplier = 2.0, .max_seconds = 10.0,
                                        .jitter = 0.0});
                     const double expected[] = {1.0, 2.0, 4.0, 8.0, 10.0, 10.0};
                     for (const double value : expected) {
                       const double delay = backoff.get_delay();
                       require(near(delay, value), "unexpected delay " + std::to_string(delay));
                     }
                     require(backoff.attempt() == 6, "every call advances the counter");
                   }});

  tests.push_back({"backoff_sequence_non_decreasing_and_bounded", [] {
                     ExponentialBackoff backoff(
                         BackoffOptions{.base_seconds = 0.5, .multiplier = 1.5, .max_seconds = 30.0,
                                        .jitter = 0.0});
                     double previous = 0.0;
                     for (int i = 0; i < 40; ++i) {
                       const double delay = backoff.get_delay();
                       require(delay >= previous, "sequence must not decrease");
                       require(delay <= 30.0, "sequence must stay under max");
                       previous = delay;
                     }
                     require(near(previous, 30.0), "sequence saturates at max");
                   }});

  tests.push_back({"backoff_reset_restores_first_delay", [] {
                     ExponentialBackoff backoff(BackoffOptions{.jitter = 0.0});
                     const double first = backoff.get_delay();
                     (void)backoff.get_delay();
                     (void)backoff.get_delay();
                     backoff.reset();
                     require(backoff.attempt() == 0, "counter cleared");
                     require(near(backoff.get_delay(), first), "reset restores the first delay");
                   }});

  tests.push_back({"backoff_jitter_stays_in_band", [] {
                     ExponentialBackoff backoff(BackoffOptions{.base_seconds = 4.0,
                                                               .multiplier = 1.0,
                                                               .max_seconds = 4.0,
                                                               .jitter = 0.25},
                                                1234);
                     bool varied = false;
                     double first = backoff.get_delay();
                     for (int i = 0; i < 200; ++i) {
                       const double delay = backoff.get_delay();
                       require(delay >= 3.0 && delay <= 5.0, "jitter outside +/-25%");
                       varied = varied || !near(delay, first);
                     }
                     require(varied, "jitter should vary the delay");
                   }});

  tests.push_back({"backoff_seeded_sequences_repeat", [] {
                     ExponentialBackoff lhs(BackoffOptions{}, 42);
                     ExponentialBackoff rhs(BackoffOptions{}, 42);
                     for (int i = 0; i < 10; ++i) {
                       require(near(lhs.get_delay(), rhs.get_delay()), "same seed, same delays");
                     }
                   }});

  tests.push_back({"backoff_next_delay_in_milliseconds", [] {
                     ExponentialBackoff backoff(
                         BackoffOptions{.base_seconds = 1.5, .multiplier = 2.0, .max_seconds = 60.0,
                                        .jitter = 0.0});
                     require(backoff.next_delay() == std::chrono::milliseconds(1500), "1.5s");
                     require(backoff.next_delay() == std::chrono::milliseconds(3000), "3s");
                   }});

  tests.push_back({"backoff_never_below_floor", [] {
                     ExponentialBackoff backoff(
                         BackoffOptions{.base_seconds = 0.001, .multiplier = 1.0, .max_seconds = 1.0,
                                        .jitter = 0.0});
                     require(near(backoff.get_delay(), 0.1), "delays are floored at 100ms");
                   }});
}
