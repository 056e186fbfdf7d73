#pragma once

#include "inferguard/common/result.hpp"
#include "inferguard/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace inferguard::registry {

struct ProviderEntry {
  std::string name;
  std::string base_url;
  std::vector<std::string> api_key_env;
  std::uint32_t requests_per_minute = 60;
  std::uint32_t requests_per_day = 1000;
  std::uint32_t burst_limit = 10;
  std::chrono::seconds cooldown{300};
  std::uint32_t priority = 1;
  bool enabled = true;
};

struct ModelEntry {
  std::string provider;
  std::string id;
  std::uint64_t context_length = 8192;
  std::vector<std::string> capabilities;
  std::uint32_t requests_per_minute = 60;
  std::uint32_t requests_per_day = 1000;
  std::uint32_t priority = 1;
  bool supports_vision = false;
  std::string cost_category = "free";

  [[nodiscard]] bool has_capability(const std::string &capability) const;
};

/// One (provider, model) pair the orchestrator may try.
struct Candidate {
  std::string provider;
  std::string model;

  bool operator==(const Candidate &) const = default;
};

struct CapabilityRequirement {
  std::vector<std::string> capabilities;
  bool vision = false;
  std::uint64_t min_context_length = 0;
  // Empty means every enabled provider is eligible.
  std::vector<std::string> providers;
};

/// Declarative provider/model catalogue. Built once at startup and read-only afterwards.
class ModelRegistry {
public:
  ModelRegistry() = default;

  [[nodiscard]] static common::Result<ModelRegistry> from_config(const config::Config &config);

  [[nodiscard]] common::Status add_provider(ProviderEntry provider);
  [[nodiscard]] common::Status add_model(ModelEntry model);

  [[nodiscard]] const ProviderEntry *find_provider(const std::string &name) const;
  [[nodiscard]] const ModelEntry *find_model(const std::string &provider,
                                             const std::string &model) const;

  [[nodiscard]] const std::vector<ProviderEntry> &providers() const { return providers_; }
  [[nodiscard]] const std::vector<ModelEntry> &models() const { return models_; }
  [[nodiscard]] std::vector<const ModelEntry *> models_for(const std::string &provider) const;

  /// Eligible candidates ordered by provider priority, then model priority, then
  /// declaration order. Lower priority numbers come first.
  [[nodiscard]] std::vector<Candidate>
  rank_candidates(const CapabilityRequirement &requirement) const;

  /// Enabled provider names in priority order.
  [[nodiscard]] std::vector<std::string> provider_order() const;

private:
  std::vector<ProviderEntry> providers_;
  std::vector<ModelEntry> models_;
};

} // namespace inferguard::registry
