#pragma once

#include "inferguard/common/clock.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace inferguard::resilience {

/// Zero means "no limit" for every field.
struct RateLimits {
  std::uint32_t requests_per_minute = 0;
  std::uint32_t requests_per_day = 0;
  std::uint32_t burst_limit = 0;
};

struct Admission {
  bool admitted = true;
  std::string reason;
  // How long until the denying condition clears; zero when admitted.
  common::Clock::duration retry_in{0};
};

struct UsageSnapshot {
  RateLimits limits;
  std::size_t last_second = 0;
  std::size_t last_minute = 0;
  std::size_t last_hour = 0;
  std::size_t last_day = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  std::optional<common::Clock::time_point> rate_limited_until;
};

/// Sliding-window admission control per (provider, model). The key (provider, "")
/// holds the provider-wide limits and cooldown; admission requires both the model key
/// and the provider key to admit.
class RateLimitTracker {
public:
  explicit RateLimitTracker(std::shared_ptr<common::Clock> clock = common::default_clock());

  void configure(const std::string &provider, const std::string &model, RateLimits limits);

  /// Read-only admission checks; they do not consume a slot.
  [[nodiscard]] bool admit(const std::string &provider, const std::string &model);
  [[nodiscard]] Admission check(const std::string &provider, const std::string &model);

  /// Checks the model key and the provider key and, when both admit, counts the request
  /// against both windows. Check and count happen under one lock, so concurrent callers
  /// can never exceed a limit between them.
  [[nodiscard]] Admission try_acquire(const std::string &provider, const std::string &model);

  /// Outcome counters of a request admitted by try_acquire().
  void record(const std::string &provider, const std::string &model, bool success = true);

  /// Refuses the key until now + reset regardless of its window counts. An empty model
  /// puts the whole provider into cooldown.
  void mark_limited(const std::string &provider, const std::string &model,
                    std::chrono::seconds reset);

  [[nodiscard]] std::optional<common::Clock::time_point>
  limited_until(const std::string &provider, const std::string &model) const;
  [[nodiscard]] UsageSnapshot snapshot(const std::string &provider,
                                       const std::string &model) const;

  /// Clears explicit limits and cooldowns of a provider and all its models. Window
  /// history is kept, it reflects real upstream traffic.
  void reset(const std::string &provider);
  void reset_all();

  /// Reset window implied by an upstream limit error: the explicit hint when present,
  /// 24h when the text talks about a daily limit, otherwise one minute.
  [[nodiscard]] static std::chrono::seconds
  reset_window_for(const std::string &error_text, std::optional<std::uint64_t> retry_after);

private:
  using Key = std::pair<std::string, std::string>;

  struct Usage {
    RateLimits limits;
    bool configured = false;
    std::deque<common::Clock::time_point> requests;
    std::uint64_t successes = 0;
    std::uint64_t failures = 0;
    std::optional<common::Clock::time_point> rate_limited_until;
  };

  [[nodiscard]] Admission check_locked(Usage &usage, common::Clock::time_point now) const;
  [[nodiscard]] Admission check_keys_locked(const std::string &provider, const std::string &model,
                                            common::Clock::time_point now);
  void prune_locked(Usage &usage, common::Clock::time_point now) const;
  [[nodiscard]] static std::size_t count_since(const std::deque<common::Clock::time_point> &events,
                                               common::Clock::time_point cutoff);

  std::shared_ptr<common::Clock> clock_;
  mutable std::mutex mutex_;
  std::map<Key, Usage> usage_;
};

} // namespace inferguard::resilience
