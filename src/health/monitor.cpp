#include "inferguard/health/monitor.hpp"

#include "inferguard/common/json_util.hpp"
#include "inferguard/observability/global.hpp"
#include "inferguard/resilience/attempt.hpp"

#include <algorithm>
#include <sstream>

namespace inferguard::health {

namespace {

// 1x1 white pixel.
constexpr const char *kProbeImagePng =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mP8/5+hHgAHggJ/PchI7wAAAABJRU5ErkJggg==";

} // namespace

std::string_view health_status_name(const HealthStatus status) {
  switch (status) {
  case HealthStatus::Unknown:
    return "unknown";
  case HealthStatus::Healthy:
    return "healthy";
  case HealthStatus::Degraded:
    return "degraded";
  case HealthStatus::Unhealthy:
    return "unhealthy";
  }
  return "unknown";
}

HealthMonitor::HealthMonitor(HealthMonitorOptions options, std::shared_ptr<common::Clock> clock)
    : options_(std::move(options)), clock_(std::move(clock)) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::register_provider(const std::string &name,
                                      std::shared_ptr<providers::Provider> client,
                                      std::string probe_model, const bool probe_with_image) {
  std::vector<std::shared_ptr<providers::Provider>> clients;
  if (client != nullptr) {
    clients.push_back(std::move(client));
  }
  register_provider(name, std::move(clients), std::move(probe_model), probe_with_image);
}

void HealthMonitor::register_provider(const std::string &name,
                                      std::vector<std::shared_ptr<providers::Provider>> clients,
                                      std::string probe_model, const bool probe_with_image) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(name);
  it->second.clients = std::move(clients);
  it->second.probe_with_image = probe_with_image;
  it->second.health = ProviderHealth{.provider = name, .probe_model = std::move(probe_model)};
  if (inserted) {
    registration_order_.push_back(name);
  }
}

bool HealthMonitor::check(const std::string &name) {
  std::vector<std::shared_ptr<providers::Provider>> clients;
  std::size_t first = 0;
  providers::InferenceRequest probe{.prompt = options_.probe_prompt,
                                    .temperature = 0.0,
                                    .max_tokens = 8,
                                    .timeout = options_.probe_timeout};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end() || it->second.clients.empty()) {
      return false;
    }
    clients = it->second.clients;
    first = it->second.health.credential_index % clients.size();
    probe.model = it->second.health.probe_model;
    if (it->second.probe_with_image) {
      probe.image_base64 = kProbeImagePng;
    }
  }

  bool healthy = false;
  std::size_t credential = first;
  std::string failure;
  for (std::size_t offset = 0; offset < clients.size(); ++offset) {
    credential = (first + offset) % clients.size();
    const auto client = clients[credential];
    const auto cancelled = resilience::make_cancel_flag();
    auto outcome = resilience::run_with_deadline(
        [client, probe]() { return client->complete(probe); },
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.probe_timeout), cancelled);
    if (outcome.result.ok()) {
      healthy = true;
      break;
    }
    failure = outcome.result.error();
    if (outcome.timed_out) {
      break;
    }
    const auto classification = classifier_.classify(failure);
    if (!classification.policy.switch_credential || classification.policy.retryable) {
      break;
    }
  }

  HealthStatus status = HealthStatus::Healthy;
  std::optional<std::string> error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
      return false;
    }
    auto &health = it->second.health;
    health.last_check = clock_->now();
    if (healthy) {
      health.status = HealthStatus::Healthy;
      health.consecutive_failures = 0;
      health.last_error.reset();
      health.credential_index = credential;
    } else {
      ++health.consecutive_failures;
      health.status = health.consecutive_failures >= options_.failure_threshold
                          ? HealthStatus::Unhealthy
                          : HealthStatus::Degraded;
      health.last_error = failure;
    }
    status = health.status;
    error = health.last_error;
  }

  observability::record_health_check(name, std::string(health_status_name(status)), error);
  return healthy;
}

bool HealthMonitor::is_stale_locked(const Entry &entry, const common::Clock::time_point now) const {
  if (!entry.health.last_check.has_value()) {
    return true;
  }
  return now - *entry.health.last_check > options_.recheck_interval;
}

void HealthMonitor::check_stale() {
  std::vector<std::string> stale;
  {
    const auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &name : registration_order_) {
      if (is_stale_locked(entries_.at(name), now)) {
        stale.push_back(name);
      }
    }
  }
  for (const auto &name : stale) {
    if (!running_ && thread_.joinable()) {
      break;
    }
    (void)check(name);
  }
}

std::optional<std::string>
HealthMonitor::get_healthy_provider(const std::vector<std::string> &preferred_order) {
  std::vector<std::string> registered;
  std::vector<std::string> stale;
  {
    const auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &name : preferred_order) {
      const auto it = entries_.find(name);
      if (it == entries_.end()) {
        continue;
      }
      registered.push_back(name);
      if (is_stale_locked(it->second, now)) {
        stale.push_back(name);
      }
    }
  }
  for (const auto &name : stale) {
    (void)check(name);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &name : registered) {
    if (entries_.at(name).health.status == HealthStatus::Healthy) {
      return name;
    }
  }
  for (const auto &name : registered) {
    if (entries_.at(name).health.status == HealthStatus::Degraded) {
      return name;
    }
  }
  return std::nullopt;
}

HealthStatus HealthMonitor::status(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(name);
  return it == entries_.end() ? HealthStatus::Unknown : it->second.health.status;
}

std::vector<ProviderHealth> HealthMonitor::get_status_report() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProviderHealth> report;
  report.reserve(registration_order_.size());
  for (const auto &name : registration_order_) {
    report.push_back(entries_.at(name).health);
  }
  return report;
}

std::string HealthMonitor::status_report_json() const {
  const auto report = get_status_report();
  std::ostringstream out;
  out << "{";
  for (std::size_t i = 0; i < report.size(); ++i) {
    const auto &entry = report[i];
    if (i > 0) {
      out << ",";
    }
    std::optional<std::string> last_check;
    if (entry.last_check.has_value()) {
      last_check = common::format_rfc3339(common::to_wall_time(*clock_, *entry.last_check));
    }
    out << "\"" << common::json_escape(entry.provider) << "\":{";
    out << "\"status\":\"" << health_status_name(entry.status) << "\",";
    out << "\"last_check\":"
        << common::json_string_or_null(last_check.has_value() ? &*last_check : nullptr) << ",";
    out << "\"failure_count\":" << entry.consecutive_failures << ",";
    out << "\"credential_index\":" << entry.credential_index << ",";
    out << "\"available\":" << (entry.available() ? "true" : "false") << ",";
    out << "\"last_error\":"
        << common::json_string_or_null(entry.last_error.has_value() ? &*entry.last_error : nullptr);
    out << "}";
  }
  out << "}";
  return out.str();
}

void HealthMonitor::reset(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(name);
  if (it == entries_.end()) {
    return;
  }
  auto &health = it->second.health;
  health.status = HealthStatus::Unknown;
  health.consecutive_failures = 0;
  health.last_check.reset();
  health.last_error.reset();
  health.credential_index = 0;
}

void HealthMonitor::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void HealthMonitor::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool HealthMonitor::is_running() const { return running_; }

void HealthMonitor::run_loop() {
  while (running_) {
    check_stale();
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(options_.poll_interval);
    const auto wait_steps = std::max<long long>(1, interval.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace inferguard::health
