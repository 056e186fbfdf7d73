#include "inferguard/registry/model_registry.hpp"

#include "inferguard/common/fs.hpp"

#include <algorithm>

namespace inferguard::registry {

namespace {

bool provider_allowed(const CapabilityRequirement &requirement, const std::string &provider) {
  if (requirement.providers.empty()) {
    return true;
  }
  return std::find(requirement.providers.begin(), requirement.providers.end(), provider) !=
         requirement.providers.end();
}

bool satisfies(const ModelEntry &model, const CapabilityRequirement &requirement) {
  if (requirement.vision && !model.supports_vision) {
    return false;
  }
  if (model.context_length < requirement.min_context_length) {
    return false;
  }
  for (const auto &capability : requirement.capabilities) {
    if (capability == "vision") {
      if (!model.supports_vision) {
        return false;
      }
      continue;
    }
    if (!model.has_capability(capability)) {
      return false;
    }
  }
  return true;
}

} // namespace

bool ModelEntry::has_capability(const std::string &capability) const {
  const std::string wanted = common::to_lower(common::trim(capability));
  return std::find(capabilities.begin(), capabilities.end(), wanted) != capabilities.end();
}

common::Result<ModelRegistry> ModelRegistry::from_config(const config::Config &config) {
  ModelRegistry registry;
  for (const auto &provider_cfg : config.providers) {
    ProviderEntry provider{
        .name = provider_cfg.name,
        .base_url = provider_cfg.base_url,
        .api_key_env = provider_cfg.api_key_env,
        .requests_per_minute = provider_cfg.requests_per_minute,
        .requests_per_day = provider_cfg.requests_per_day,
        .burst_limit = provider_cfg.burst_limit,
        .cooldown = std::chrono::seconds(provider_cfg.cooldown_seconds),
        .priority = provider_cfg.priority,
        .enabled = provider_cfg.enabled,
    };
    if (auto status = registry.add_provider(std::move(provider)); !status.ok()) {
      return common::Result<ModelRegistry>::failure(status.error());
    }

    for (const auto &model_cfg : provider_cfg.models) {
      ModelEntry model{
          .provider = provider_cfg.name,
          .id = model_cfg.id,
          .context_length = model_cfg.context_length,
          .capabilities = model_cfg.capabilities,
          .requests_per_minute =
              model_cfg.requests_per_minute.value_or(provider_cfg.requests_per_minute),
          .requests_per_day = model_cfg.requests_per_day.value_or(provider_cfg.requests_per_day),
          .priority = model_cfg.priority,
          .supports_vision = model_cfg.supports_vision,
          .cost_category = model_cfg.cost_category,
      };
      if (auto status = registry.add_model(std::move(model)); !status.ok()) {
        return common::Result<ModelRegistry>::failure(status.error());
      }
    }
  }
  return common::Result<ModelRegistry>::success(std::move(registry));
}

common::Status ModelRegistry::add_provider(ProviderEntry provider) {
  if (provider.name.empty()) {
    return common::Status::error("provider name is required");
  }
  if (find_provider(provider.name) != nullptr) {
    return common::Status::error("duplicate provider: " + provider.name);
  }
  providers_.push_back(std::move(provider));
  return common::Status::success();
}

common::Status ModelRegistry::add_model(ModelEntry model) {
  if (model.id.empty()) {
    return common::Status::error("model id is required");
  }
  if (find_provider(model.provider) == nullptr) {
    return common::Status::error("unknown provider for model " + model.id + ": " + model.provider);
  }
  if (find_model(model.provider, model.id) != nullptr) {
    return common::Status::error("duplicate model: " + model.provider + "/" + model.id);
  }
  for (auto &capability : model.capabilities) {
    capability = common::to_lower(common::trim(capability));
  }
  models_.push_back(std::move(model));
  return common::Status::success();
}

const ProviderEntry *ModelRegistry::find_provider(const std::string &name) const {
  for (const auto &provider : providers_) {
    if (provider.name == name) {
      return &provider;
    }
  }
  return nullptr;
}

const ModelEntry *ModelRegistry::find_model(const std::string &provider,
                                            const std::string &model) const {
  for (const auto &entry : models_) {
    if (entry.provider == provider && entry.id == model) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<const ModelEntry *> ModelRegistry::models_for(const std::string &provider) const {
  std::vector<const ModelEntry *> out;
  for (const auto &entry : models_) {
    if (entry.provider == provider) {
      out.push_back(&entry);
    }
  }
  return out;
}

std::vector<Candidate>
ModelRegistry::rank_candidates(const CapabilityRequirement &requirement) const {
  struct Ranked {
    std::uint32_t provider_priority;
    std::uint32_t model_priority;
    const ModelEntry *model;
  };

  std::vector<Ranked> ranked;
  for (const auto &model : models_) {
    const ProviderEntry *provider = find_provider(model.provider);
    if (provider == nullptr || !provider->enabled) {
      continue;
    }
    if (!provider_allowed(requirement, provider->name) || !satisfies(model, requirement)) {
      continue;
    }
    ranked.push_back(Ranked{provider->priority, model.priority, &model});
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked &lhs, const Ranked &rhs) {
    if (lhs.provider_priority != rhs.provider_priority) {
      return lhs.provider_priority < rhs.provider_priority;
    }
    return lhs.model_priority < rhs.model_priority;
  });

  std::vector<Candidate> out;
  out.reserve(ranked.size());
  for (const auto &entry : ranked) {
    out.push_back(Candidate{entry.model->provider, entry.model->id});
  }
  return out;
}

std::vector<std::string> ModelRegistry::provider_order() const {
  std::vector<const ProviderEntry *> enabled;
  for (const auto &provider : providers_) {
    if (provider.enabled) {
      enabled.push_back(&provider);
    }
  }
  std::stable_sort(enabled.begin(), enabled.end(),
                   [](const ProviderEntry *lhs, const ProviderEntry *rhs) {
                     return lhs->priority < rhs->priority;
                   });
  std::vector<std::string> out;
  out.reserve(enabled.size());
  for (const auto *provider : enabled) {
    out.push_back(provider->name);
  }
  return out;
}

} // namespace inferguard::registry
