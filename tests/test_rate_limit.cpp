#include "test_framework.hpp"

#include "inferguard/resilience/rate_limit_tracker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <thread>

namespace {

using inferguard::resilience::RateLimits;
using inferguard::resilience::RateLimitTracker;
using inferguard::testing::ManualClock;

} // namespace

void register_rate_limit_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"rate_limit_unconfigured_key_admits", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     for (int i = 0; i < 100; ++i) {
                       (void)tracker.try_acquire("p", "m");
                     }
                     require(tracker.admit("p", "m"), "no limits means admission");
                   }});

  tests.push_back({"rate_limit_rpm_denies_at_limit_and_recovers", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 2});
                     (void)tracker.try_acquire("p", "m");
                     clock->advance(5s);
                     require(tracker.admit("p", "m"), "one of two used");
                     (void)tracker.try_acquire("p", "m");
                     auto admission = tracker.check("p", "m");
                     require(!admission.admitted, "two of two used");
                     require(admission.reason == "requests per minute exhausted", admission.reason);
                     require(admission.retry_in == 55s, "oldest request leaves the window in 55s");

                     clock->advance(54s);
                     require(!tracker.admit("p", "m"), "59s old still counts");
                     clock->advance(1s);
                     require(tracker.admit("p", "m"), "a 60s old request has left the window");
                   }});

  tests.push_back({"rate_limit_rpd_denies_across_minutes", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m",
                                       RateLimits{.requests_per_minute = 100, .requests_per_day = 3});
                     for (int i = 0; i < 3; ++i) {
                       (void)tracker.try_acquire("p", "m");
                       clock->advance(10min);
                     }
                     auto admission = tracker.check("p", "m");
                     require(!admission.admitted, "daily limit reached");
                     require(admission.reason == "requests per day exhausted", admission.reason);
                     clock->advance(24h);
                     require(tracker.admit("p", "m"), "entries older than 24h are pruned");
                   }});

  tests.push_back({"rate_limit_mark_limited_overrides_counts", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 10});
                     tracker.mark_limited("p", "m", 30s);
                     auto admission = tracker.check("p", "m");
                     require(!admission.admitted, "explicitly limited");
                     require(admission.reason == "rate limited", admission.reason);
                     require(admission.retry_in == 30s, "retry in until expiry");
                     require(tracker.limited_until("p", "m").has_value(), "limited_until set");

                     tracker.mark_limited("p", "m", 5s);
                     require(*tracker.limited_until("p", "m") == clock->now() + 30s,
                             "shorter marks do not shrink an existing limit");

                     clock->advance(29s);
                     require(!tracker.admit("p", "m"), "still limited before expiry");
                     clock->advance(1s);
                     require(tracker.admit("p", "m"), "limit expires");
                     require(!tracker.limited_until("p", "m").has_value(), "expired limit cleared");
                   }});

  tests.push_back({"rate_limit_provider_key_gates_models", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "", RateLimits{.requests_per_minute = 2});
                     tracker.configure("p", "a", RateLimits{.requests_per_minute = 10});
                     tracker.configure("p", "b", RateLimits{.requests_per_minute = 10});
                     (void)tracker.try_acquire("p", "a");
                     (void)tracker.try_acquire("p", "b");
                     auto admission = tracker.check("p", "a");
                     require(!admission.admitted, "provider-wide window is shared by models");
                     require(admission.reason == "provider requests per minute exhausted",
                             admission.reason);

                     tracker.mark_limited("q", "", 60s);
                     require(!tracker.admit("q", "any"), "provider cooldown blocks every model");
                   }});

  tests.push_back({"rate_limit_burst_window", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "", RateLimits{.burst_limit = 2});
                     (void)tracker.try_acquire("p", "");
                     (void)tracker.try_acquire("p", "");
                     auto admission = tracker.check("p", "");
                     require(!admission.admitted, "burst reached");
                     require(admission.reason == "burst limit reached", admission.reason);
                     clock->advance(1001ms);
                     require(tracker.admit("p", ""), "burst window slides after a second");
                   }});

  tests.push_back({"rate_limit_snapshot_counts_and_outcomes", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 5});
                     (void)tracker.try_acquire("p", "m");
                     tracker.record("p", "m", true);
                     clock->advance(2h);
                     (void)tracker.try_acquire("p", "m");
                     tracker.record("p", "m", false);
                     (void)tracker.try_acquire("p", "m");
                     tracker.record("p", "m", true);
                     const auto snapshot = tracker.snapshot("p", "m");
                     require(snapshot.limits.requests_per_minute == 5, "limits reported");
                     require(snapshot.last_minute == 2, "minute window");
                     require(snapshot.last_hour == 2, "hour window");
                     require(snapshot.last_day == 3, "day window");
                     require(snapshot.successes == 2 && snapshot.failures == 1, "outcome counters");
                     const auto provider = tracker.snapshot("p", "");
                     require(provider.last_day == 3, "acquisitions roll up to the provider key");
                     require(provider.successes == 2, "outcomes roll up to the provider key");
                   }});

  tests.push_back({"rate_limit_try_acquire_counts_only_admitted_requests", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 1});
                     require(tracker.check("p", "m").admitted, "check does not consume");
                     require(tracker.check("p", "m").admitted, "check is repeatable");
                     require(tracker.try_acquire("p", "m").admitted, "first acquisition");
                     auto denied = tracker.try_acquire("p", "m");
                     require(!denied.admitted, "second acquisition denied");
                     require(denied.retry_in == 60s, "slot frees a minute after the first");
                     require(tracker.snapshot("p", "m").last_minute == 1,
                             "denied acquisitions leave no trace");
                   }});

  tests.push_back({"rate_limit_try_acquire_is_atomic_across_threads", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "", RateLimits{.requests_per_minute = 5});
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 3});
                     std::atomic<int> admitted{0};
                     std::vector<std::thread> threads;
                     for (int t = 0; t < 8; ++t) {
                       threads.emplace_back([&] {
                         for (int i = 0; i < 50; ++i) {
                           if (tracker.try_acquire("p", "m").admitted) {
                             ++admitted;
                           }
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(admitted.load() == 3, "exactly the model limit is admitted");
                     require(tracker.snapshot("p", "").last_minute == 3,
                             "provider window counts the same requests");
                   }});

  tests.push_back({"rate_limit_reset_clears_limits_keeps_history", [] {
                     auto clock = std::make_shared<ManualClock>();
                     RateLimitTracker tracker(clock);
                     tracker.configure("p", "m", RateLimits{.requests_per_minute = 1});
                     (void)tracker.try_acquire("p", "m");
                     tracker.mark_limited("p", "", 300s);
                     tracker.mark_limited("p", "m", 60s);
                     tracker.reset("p");
                     require(!tracker.limited_until("p", "").has_value(), "provider cooldown cleared");
                     require(!tracker.limited_until("p", "m").has_value(), "model limit cleared");
                     require(!tracker.admit("p", "m"), "window counts survive a reset");
                   }});

  tests.push_back({"rate_limit_reset_window_inference", [] {
                     require(RateLimitTracker::reset_window_for("slow down", 42) == 42s, "hint wins");
                     require(RateLimitTracker::reset_window_for("Daily limit exceeded", std::nullopt) ==
                                 24h,
                             "daily phrasing implies a day");
                     require(RateLimitTracker::reset_window_for("requests per day", std::nullopt) ==
                                 24h,
                             "day phrasing implies a day");
                     require(RateLimitTracker::reset_window_for("429 Too Many Requests",
                                                                std::nullopt) == 60s,
                             "default is a minute");
                   }});
}
