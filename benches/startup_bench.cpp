#include "bench_common.hpp"

#include "inferguard/config/config.hpp"
#include "inferguard/runtime/app.hpp"

namespace {

inferguard::config::Config bench_config() {
  inferguard::config::Config config;
  config.observability.backend = "none";
  config.health.enabled = false;
  for (int p = 0; p < 8; ++p) {
    inferguard::config::ProviderConfig provider;
    provider.name = "provider-" + std::to_string(p);
    provider.base_url = "http://127.0.0.1:9/v1";
    provider.priority = static_cast<std::uint32_t>(p);
    for (int m = 0; m < 6; ++m) {
      inferguard::config::ModelConfig model;
      model.id = "model-" + std::to_string(m);
      model.capabilities = {"reasoning"};
      provider.models.push_back(model);
    }
    config.providers.push_back(provider);
  }
  return config;
}

} // namespace

void run_startup_benchmark() {
  const auto config = bench_config();
  inferguard::bench::run_bench("startup_stack", 200, [&] {
    inferguard::runtime::RuntimeContext context(config);
    (void)context.create_stack_with_clients({});
  });
}
