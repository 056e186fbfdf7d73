#include "test_framework.hpp"

#include "inferguard/registry/model_registry.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

inferguard::config::Config catalogue() {
  auto config = inferguard::testing::mock_config();

  inferguard::config::ModelConfig beta_vision;
  beta_vision.id = "beta-vision";
  beta_vision.capabilities = {"vision"};
  beta_vision.supports_vision = true;
  beta_vision.context_length = 32000;
  beta_vision.priority = 0;
  config.providers[1].models.push_back(beta_vision);

  inferguard::config::ProviderConfig gamma;
  gamma.name = "gamma";
  gamma.base_url = "https://gamma.example.com/v1";
  gamma.priority = 1;
  gamma.enabled = false;
  inferguard::config::ModelConfig gamma_model;
  gamma_model.id = "gamma-vision";
  gamma_model.supports_vision = true;
  gamma.models.push_back(gamma_model);
  config.providers.push_back(gamma);
  return config;
}

} // namespace

void register_registry_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;
  namespace r = inferguard::registry;

  tests.push_back({"registry_from_config_inherits_provider_limits", [] {
                     auto config = catalogue();
                     config.providers[0].requests_per_minute = 30;
                     config.providers[0].models[0].requests_per_day = 12;
                     auto registry = r::ModelRegistry::from_config(config);
                     require(registry.ok(), registry.error_message());
                     const auto *model = registry.value().find_model("alpha", "alpha-vision");
                     require(model != nullptr, "alpha model should exist");
                     require(model->requests_per_minute == 30, "rpm inherited from provider");
                     require(model->requests_per_day == 12, "rpd override kept");
                     const auto *provider = registry.value().find_provider("alpha");
                     require(provider != nullptr && provider->cooldown == std::chrono::seconds(300),
                             "default cooldown");
                   }});

  tests.push_back({"registry_rejects_duplicates", [] {
                     r::ModelRegistry registry;
                     require(registry.add_provider(r::ProviderEntry{.name = "alpha"}).ok(),
                             "first add");
                     auto duplicate = registry.add_provider(r::ProviderEntry{.name = "alpha"});
                     require(!duplicate.ok(), "duplicate provider must fail");
                     require(registry.add_model(r::ModelEntry{.provider = "alpha", .id = "m"}).ok(),
                             "model add");
                     require(!registry.add_model(r::ModelEntry{.provider = "alpha", .id = "m"}).ok(),
                             "duplicate model must fail");
                     auto orphan = registry.add_model(r::ModelEntry{.provider = "nope", .id = "x"});
                     require(!orphan.ok(), "model of unknown provider must fail");
                     require(orphan.error().find("unknown provider") != std::string::npos,
                             orphan.error());
                   }});

  tests.push_back({"registry_rank_orders_by_provider_then_model_priority", [] {
                     auto registry = r::ModelRegistry::from_config(catalogue());
                     require(registry.ok(), registry.error_message());
                     const auto ranked = registry.value().rank_candidates({});
                     require(ranked.size() == 3, "disabled provider excluded");
                     require(ranked[0] == r::Candidate{"alpha", "alpha-vision"}, "alpha first");
                     require(ranked[1] == r::Candidate{"beta", "beta-vision"},
                             "lower model priority first within beta");
                     require(ranked[2] == r::Candidate{"beta", "beta-text"}, "beta text last");
                   }});

  tests.push_back({"registry_rank_filters_vision", [] {
                     auto registry = r::ModelRegistry::from_config(catalogue());
                     require(registry.ok(), registry.error_message());
                     const auto ranked = registry.value().rank_candidates({.vision = true});
                     require(ranked.size() == 2, "two vision models on enabled providers");
                     for (const auto &candidate : ranked) {
                       require(candidate.model != "beta-text", "text model must be filtered");
                       require(candidate.provider != "gamma", "disabled provider must be filtered");
                     }
                   }});

  tests.push_back({"registry_rank_filters_capabilities_and_context", [] {
                     auto registry = r::ModelRegistry::from_config(catalogue());
                     require(registry.ok(), registry.error_message());
                     const auto &reg = registry.value();

                     auto analysis = reg.rank_candidates({.capabilities = {"Analysis"}});
                     require(analysis.size() == 1 && analysis[0].model == "alpha-vision",
                             "capability match is case-insensitive");

                     auto long_context = reg.rank_candidates({.min_context_length = 16000});
                     require(long_context.size() == 1 && long_context[0].model == "beta-vision",
                             "context filter");

                     auto only_beta = reg.rank_candidates({.providers = {"beta"}});
                     require(only_beta.size() == 2, "provider allow-list");

                     auto none = reg.rank_candidates({.capabilities = {"citations"}});
                     require(none.empty(), "unknown capability yields no candidates");
                   }});

  tests.push_back({"registry_provider_order_skips_disabled", [] {
                     auto registry = r::ModelRegistry::from_config(catalogue());
                     require(registry.ok(), registry.error_message());
                     const auto order = registry.value().provider_order();
                     require(order.size() == 2, "gamma is disabled");
                     require(order[0] == "alpha" && order[1] == "beta", "priority order");
                     require(registry.value().models_for("beta").size() == 2, "models_for");
                   }});
}
