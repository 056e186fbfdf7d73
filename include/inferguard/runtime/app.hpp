#pragma once

#include "inferguard/common/clock.hpp"
#include "inferguard/common/result.hpp"
#include "inferguard/config/schema.hpp"
#include "inferguard/health/monitor.hpp"
#include "inferguard/providers/factory.hpp"
#include "inferguard/providers/reliable.hpp"
#include "inferguard/registry/model_registry.hpp"
#include "inferguard/resilience/orchestrator.hpp"

#include <memory>

namespace inferguard::runtime {

/// Every long-lived component, wired together from one Config.
struct ResilienceStack {
  std::shared_ptr<const registry::ModelRegistry> registry;
  std::shared_ptr<resilience::RateLimitTracker> tracker;
  std::shared_ptr<resilience::ResponseCache> cache;
  std::shared_ptr<resilience::ErrorHistory> history;
  std::shared_ptr<health::HealthMonitor> health;
  std::shared_ptr<resilience::Orchestrator> orchestrator;
  providers::ClientTable clients;
  std::shared_ptr<providers::ReliableProvider> provider;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config,
                          std::shared_ptr<common::Clock> clock = common::default_clock());

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Validates the config, installs the global observer and builds the stack. Health
  /// probing is registered but not started.
  [[nodiscard]] common::Result<std::shared_ptr<ResilienceStack>>
  create_stack(std::shared_ptr<providers::HttpClient> http_client =
                   std::make_shared<providers::CurlHttpClient>());

  /// Same as create_stack but with caller-supplied clients, one list per provider.
  [[nodiscard]] common::Result<std::shared_ptr<ResilienceStack>>
  create_stack_with_clients(providers::ClientTable clients);

  [[nodiscard]] static resilience::OrchestratorOptions
  orchestrator_options(const config::Config &config);
  [[nodiscard]] static health::HealthMonitorOptions health_options(const config::Config &config);
  [[nodiscard]] static resilience::CacheOptions cache_options(const config::Config &config);

private:
  config::Config config_;
  std::shared_ptr<common::Clock> clock_;
};

} // namespace inferguard::runtime
