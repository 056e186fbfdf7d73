#pragma once

#include "inferguard/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace inferguard::observability {

enum class LogLevel { Debug, Info, Warn, Error };

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

[[nodiscard]] LogLevel parse_log_level(const std::string &value, LogLevel fallback);

} // namespace inferguard::observability
