#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace inferguard::common {

/// Time source shared by every component that keeps windows, deadlines or cooldowns.
/// Production code uses SteadyClock; tests substitute a manually advanced clock.
class Clock {
public:
  using duration = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;

  [[nodiscard]] virtual time_point now() const = 0;
  virtual void sleep_for(std::chrono::milliseconds delay) = 0;
};

class SteadyClock final : public Clock {
public:
  [[nodiscard]] time_point now() const override;
  void sleep_for(std::chrono::milliseconds delay) override;
};

[[nodiscard]] std::shared_ptr<Clock> default_clock();

/// Maps a point on `clock` to wall-clock time, relative to the current instant.
[[nodiscard]] std::chrono::system_clock::time_point to_wall_time(const Clock &clock,
                                                                 Clock::time_point point);

[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point point);
[[nodiscard]] std::string now_rfc3339();

} // namespace inferguard::common
