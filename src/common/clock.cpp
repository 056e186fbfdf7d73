#include "inferguard/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace inferguard::common {

Clock::time_point SteadyClock::now() const { return std::chrono::steady_clock::now(); }

void SteadyClock::sleep_for(const std::chrono::milliseconds delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

std::shared_ptr<Clock> default_clock() {
  static const auto clock = std::make_shared<SteadyClock>();
  return clock;
}

std::chrono::system_clock::time_point to_wall_time(const Clock &clock,
                                                   const Clock::time_point point) {
  const auto offset = point - clock.now();
  return std::chrono::system_clock::now() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
}

std::string format_rfc3339(const std::chrono::system_clock::time_point point) {
  const auto t = std::chrono::system_clock::to_time_t(point);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

} // namespace inferguard::common
