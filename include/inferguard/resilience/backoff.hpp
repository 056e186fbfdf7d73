#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace inferguard::resilience {

struct BackoffOptions {
  double base_seconds = 1.0;
  double multiplier = 2.0;
  double max_seconds = 300.0;
  // Fraction of the delay used as a symmetric uniform jitter band; 0 disables jitter.
  double jitter = 0.25;
};

/// Per-provider delay generator: min(base * multiplier^attempt, max) with jitter.
/// Not internally synchronized; the owner guards it.
class ExponentialBackoff {
public:
  explicit ExponentialBackoff(BackoffOptions options = {},
                              std::optional<std::uint64_t> seed = std::nullopt);

  /// Returns the next delay in seconds and advances the attempt counter.
  [[nodiscard]] double get_delay();
  [[nodiscard]] std::chrono::milliseconds next_delay();

  void reset() { attempt_ = 0; }
  [[nodiscard]] std::uint32_t attempt() const { return attempt_; }
  [[nodiscard]] const BackoffOptions &options() const { return options_; }

private:
  static constexpr double kMinimumDelaySeconds = 0.1;

  BackoffOptions options_;
  std::uint32_t attempt_ = 0;
  std::mt19937_64 rng_;
};

} // namespace inferguard::resilience
