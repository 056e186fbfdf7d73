#include "inferguard/resilience/backoff.hpp"

#include <algorithm>
#include <cmath>

namespace inferguard::resilience {

ExponentialBackoff::ExponentialBackoff(BackoffOptions options,
                                       const std::optional<std::uint64_t> seed)
    : options_(options), rng_(seed.has_value() ? *seed : std::random_device{}()) {}

double ExponentialBackoff::get_delay() {
  const double exponent = static_cast<double>(attempt_);
  const double delay = std::min(options_.base_seconds * std::pow(options_.multiplier, exponent),
                                options_.max_seconds);
  ++attempt_;

  double jitter = 0.0;
  if (options_.jitter > 0.0) {
    std::uniform_real_distribution<double> band(-1.0, 1.0);
    jitter = delay * options_.jitter * band(rng_);
  }
  return std::max(kMinimumDelaySeconds, delay + jitter);
}

std::chrono::milliseconds ExponentialBackoff::next_delay() {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(get_delay() * 1000.0)));
}

} // namespace inferguard::resilience
