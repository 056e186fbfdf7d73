#include "inferguard/observability/factory.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/observability/log_observer.hpp"
#include "inferguard/observability/multi_observer.hpp"
#include "inferguard/observability/noop_observer.hpp"

namespace inferguard::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.log_level, LogLevel::Info);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    for (const auto &part : common::split(backend, ',')) {
      if (part == "log") {
        multi->add(std::make_unique<LogObserver>(level));
      } else if (part == "noop" || part == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(level);
}

} // namespace inferguard::observability
