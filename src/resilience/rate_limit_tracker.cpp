#include "inferguard/resilience/rate_limit_tracker.hpp"

#include "inferguard/common/fs.hpp"

#include <algorithm>
#include <iterator>

namespace inferguard::resilience {

namespace {

constexpr std::chrono::seconds kSecond{1};
constexpr std::chrono::seconds kMinute{60};
constexpr std::chrono::seconds kHour{3600};
constexpr std::chrono::seconds kDay{86400};

} // namespace

RateLimitTracker::RateLimitTracker(std::shared_ptr<common::Clock> clock)
    : clock_(std::move(clock)) {}

void RateLimitTracker::configure(const std::string &provider, const std::string &model,
                                 const RateLimits limits) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &usage = usage_[Key{provider, model}];
  usage.limits = limits;
  usage.configured = true;
}

std::size_t RateLimitTracker::count_since(const std::deque<common::Clock::time_point> &events,
                                          const common::Clock::time_point cutoff) {
  const auto first = std::upper_bound(events.begin(), events.end(), cutoff);
  return static_cast<std::size_t>(std::distance(first, events.end()));
}

void RateLimitTracker::prune_locked(Usage &usage, const common::Clock::time_point now) const {
  const auto cutoff = now - kDay;
  while (!usage.requests.empty() && usage.requests.front() <= cutoff) {
    usage.requests.pop_front();
  }
}

Admission RateLimitTracker::check_locked(Usage &usage, const common::Clock::time_point now) const {
  prune_locked(usage, now);

  if (usage.rate_limited_until.has_value()) {
    if (now < *usage.rate_limited_until) {
      return Admission{.admitted = false,
                       .reason = "rate limited",
                       .retry_in = *usage.rate_limited_until - now};
    }
    usage.rate_limited_until.reset();
  }

  // Time until the oldest request inside `window` leaves it.
  const auto window_clears = [&](const std::chrono::seconds window, const std::size_t inside) {
    const auto oldest = usage.requests[usage.requests.size() - inside];
    return oldest + window - now;
  };

  const auto &limits = usage.limits;
  if (limits.burst_limit > 0) {
    const std::size_t in_second = count_since(usage.requests, now - kSecond);
    if (in_second >= limits.burst_limit) {
      return Admission{.admitted = false,
                       .reason = "burst limit reached",
                       .retry_in = window_clears(kSecond, in_second)};
    }
  }
  if (limits.requests_per_minute > 0) {
    const std::size_t in_minute = count_since(usage.requests, now - kMinute);
    if (in_minute >= limits.requests_per_minute) {
      return Admission{.admitted = false,
                       .reason = "requests per minute exhausted",
                       .retry_in = window_clears(kMinute, in_minute)};
    }
  }
  if (limits.requests_per_day > 0 && usage.requests.size() >= limits.requests_per_day) {
    return Admission{.admitted = false,
                     .reason = "requests per day exhausted",
                     .retry_in = window_clears(kDay, usage.requests.size())};
  }
  return Admission{};
}

Admission RateLimitTracker::check_keys_locked(const std::string &provider,
                                              const std::string &model,
                                              const common::Clock::time_point now) {
  if (auto it = usage_.find(Key{provider, model}); it != usage_.end()) {
    if (auto admission = check_locked(it->second, now); !admission.admitted) {
      return admission;
    }
  }
  if (!model.empty()) {
    if (auto it = usage_.find(Key{provider, ""}); it != usage_.end()) {
      if (auto admission = check_locked(it->second, now); !admission.admitted) {
        admission.reason = "provider " + admission.reason;
        return admission;
      }
    }
  }
  return Admission{};
}

Admission RateLimitTracker::check(const std::string &provider, const std::string &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  return check_keys_locked(provider, model, clock_->now());
}

bool RateLimitTracker::admit(const std::string &provider, const std::string &model) {
  return check(provider, model).admitted;
}

Admission RateLimitTracker::try_acquire(const std::string &provider, const std::string &model) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Read under the lock so every window stays sorted.
  const auto now = clock_->now();
  Admission admission = check_keys_locked(provider, model, now);
  if (!admission.admitted) {
    return admission;
  }
  usage_[Key{provider, model}].requests.push_back(now);
  if (!model.empty()) {
    usage_[Key{provider, ""}].requests.push_back(now);
  }
  return admission;
}

void RateLimitTracker::record(const std::string &provider, const std::string &model,
                              const bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto bump = [&](Usage &usage) {
    if (success) {
      ++usage.successes;
    } else {
      ++usage.failures;
    }
  };
  bump(usage_[Key{provider, model}]);
  if (!model.empty()) {
    bump(usage_[Key{provider, ""}]);
  }
}

void RateLimitTracker::mark_limited(const std::string &provider, const std::string &model,
                                    const std::chrono::seconds reset) {
  const auto until = clock_->now() + reset;
  std::lock_guard<std::mutex> lock(mutex_);
  auto &usage = usage_[Key{provider, model}];
  if (!usage.rate_limited_until.has_value() || *usage.rate_limited_until < until) {
    usage.rate_limited_until = until;
  }
}

std::optional<common::Clock::time_point>
RateLimitTracker::limited_until(const std::string &provider, const std::string &model) const {
  const auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = usage_.find(Key{provider, model});
  if (it == usage_.end() || !it->second.rate_limited_until.has_value() ||
      *it->second.rate_limited_until <= now) {
    return std::nullopt;
  }
  return it->second.rate_limited_until;
}

UsageSnapshot RateLimitTracker::snapshot(const std::string &provider,
                                         const std::string &model) const {
  const auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);
  UsageSnapshot out;
  const auto it = usage_.find(Key{provider, model});
  if (it == usage_.end()) {
    return out;
  }
  const Usage &usage = it->second;
  out.limits = usage.limits;
  out.last_second = count_since(usage.requests, now - kSecond);
  out.last_minute = count_since(usage.requests, now - kMinute);
  out.last_hour = count_since(usage.requests, now - kHour);
  out.last_day = count_since(usage.requests, now - kDay);
  out.successes = usage.successes;
  out.failures = usage.failures;
  if (usage.rate_limited_until.has_value() && *usage.rate_limited_until > now) {
    out.rate_limited_until = usage.rate_limited_until;
  }
  return out;
}

void RateLimitTracker::reset(const std::string &provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[key, usage] : usage_) {
    if (key.first == provider) {
      usage.rate_limited_until.reset();
    }
  }
}

void RateLimitTracker::reset_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[key, usage] : usage_) {
    usage.rate_limited_until.reset();
  }
}

std::chrono::seconds RateLimitTracker::reset_window_for(const std::string &error_text,
                                                        const std::optional<std::uint64_t> retry_after) {
  if (retry_after.has_value() && *retry_after > 0) {
    return std::chrono::seconds(*retry_after);
  }
  if (common::contains_ci(error_text, "daily") || common::contains_ci(error_text, "day")) {
    return kDay;
  }
  return kMinute;
}

} // namespace inferguard::resilience
