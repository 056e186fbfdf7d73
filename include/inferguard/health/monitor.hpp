#pragma once

#include "inferguard/common/clock.hpp"
#include "inferguard/providers/traits.hpp"
#include "inferguard/resilience/error_classifier.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace inferguard::health {

enum class HealthStatus { Unknown, Healthy, Degraded, Unhealthy };

[[nodiscard]] std::string_view health_status_name(HealthStatus status);

struct HealthMonitorOptions {
  std::chrono::seconds poll_interval{60};
  std::chrono::seconds recheck_interval{300};
  std::uint32_t failure_threshold = 3;
  std::chrono::seconds probe_timeout{10};
  std::string probe_prompt = "Health check test";
};

struct ProviderHealth {
  std::string provider;
  HealthStatus status = HealthStatus::Unknown;
  std::optional<common::Clock::time_point> last_check;
  std::uint32_t consecutive_failures = 0;
  std::optional<std::string> last_error;
  std::string probe_model;
  // Credential that answered the last successful probe.
  std::size_t credential_index = 0;

  [[nodiscard]] bool available() const {
    return status == HealthStatus::Healthy || status == HealthStatus::Degraded;
  }
};

/// Probes each registered provider with a minimal completion and tracks
/// healthy/degraded/unhealthy. The background loop only refreshes stale entries and
/// never holds the lock across a probe, so request paths reading status are not blocked.
class HealthMonitor {
public:
  explicit HealthMonitor(HealthMonitorOptions options = {},
                         std::shared_ptr<common::Clock> clock = common::default_clock());
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor &) = delete;
  HealthMonitor &operator=(const HealthMonitor &) = delete;

  /// `probe_with_image` attaches a 1x1 PNG so vision endpoints are exercised too.
  void register_provider(const std::string &name, std::shared_ptr<providers::Provider> client,
                         std::string probe_model, bool probe_with_image = false);
  /// One client per credential. A probe refused for authentication or billing moves on to
  /// the next credential: a revoked key says nothing about the provider's health.
  void register_provider(const std::string &name,
                         std::vector<std::shared_ptr<providers::Provider>> clients,
                         std::string probe_model, bool probe_with_image = false);

  /// Runs one probe now. Unknown providers report false.
  bool check(const std::string &name);
  /// Probes every provider whose last check is missing or older than the re-check interval.
  void check_stale();

  /// First healthy provider in `preferred_order`, else the first degraded one. Stale
  /// entries are re-probed before being judged.
  [[nodiscard]] std::optional<std::string>
  get_healthy_provider(const std::vector<std::string> &preferred_order);

  [[nodiscard]] HealthStatus status(const std::string &name) const;
  [[nodiscard]] std::vector<ProviderHealth> get_status_report() const;
  [[nodiscard]] std::string status_report_json() const;
  void reset(const std::string &name);

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  struct Entry {
    std::vector<std::shared_ptr<providers::Provider>> clients;
    bool probe_with_image = false;
    ProviderHealth health;
  };

  [[nodiscard]] bool is_stale_locked(const Entry &entry, common::Clock::time_point now) const;
  void run_loop();

  HealthMonitorOptions options_;
  std::shared_ptr<common::Clock> clock_;
  resilience::ErrorClassifier classifier_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
  std::vector<std::string> registration_order_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace inferguard::health
