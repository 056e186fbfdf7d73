#include "bench_common.hpp"

#include "inferguard/resilience/orchestrator.hpp"

#include <memory>
#include <thread>
#include <vector>

namespace {

namespace r = inferguard::registry;
namespace res = inferguard::resilience;

std::shared_ptr<res::Orchestrator> make_orchestrator() {
  r::ModelRegistry registry;
  for (const auto *name : {"primary", "secondary", "tertiary"}) {
    r::ProviderEntry provider;
    provider.name = name;
    provider.requests_per_minute = 1000000;
    provider.requests_per_day = 10000000;
    provider.burst_limit = 0;
    (void)registry.add_provider(provider);
    r::ModelEntry model;
    model.provider = name;
    model.id = std::string(name) + "-model";
    model.requests_per_minute = 1000000;
    model.requests_per_day = 10000000;
    (void)registry.add_model(model);
  }

  res::OrchestratorOptions options;
  // Inline attempts: the thread hop would dominate the measurement.
  options.attempt_timeout = std::chrono::milliseconds(0);
  options.breaker.failure_threshold = 1000000;
  options.backoff.base_seconds = 0.0;
  options.backoff.jitter = 0.0;
  return std::make_shared<res::Orchestrator>(
      std::make_shared<const r::ModelRegistry>(std::move(registry)), options,
      std::make_shared<res::RateLimitTracker>(), std::make_shared<res::ResponseCache>(),
      std::make_shared<res::ErrorHistory>());
}

} // namespace

void run_orchestrator_benchmarks() {
  std::cout << "\n=== Orchestrator Benchmarks ===\n";

  {
    auto orchestrator = make_orchestrator();
    const auto candidates = orchestrator->registry().rank_candidates({});
    const res::RequestFn fn = [](const r::Candidate &, const res::AttemptContext &) {
      return inferguard::common::Result<std::string>::success("ok");
    };
    inferguard::bench::run_bench("fallback_first_candidate", 2000, [&] {
      (void)orchestrator->execute_with_fallback("bench", candidates, fn);
    });
  }

  {
    auto orchestrator = make_orchestrator();
    const auto candidates = orchestrator->registry().rank_candidates({});
    const res::RequestFn fn = [](const r::Candidate &candidate, const res::AttemptContext &) {
      if (candidate.provider != "tertiary") {
        return inferguard::common::Result<std::string>::failure("api error status=500");
      }
      return inferguard::common::Result<std::string>::success("ok");
    };
    // After the first pass the failed providers sit in backoff and are skipped.
    const res::ExecuteOptions budget{.overall_budget = std::chrono::milliseconds(50)};
    inferguard::bench::run_bench("fallback_skip_backed_off", 500, [&] {
      (void)orchestrator->execute_with_fallback("bench", candidates, fn, {}, budget);
    });
  }

  {
    auto orchestrator = make_orchestrator();
    const auto candidates = orchestrator->registry().rank_candidates({});
    const res::RequestFn fn = [](const r::Candidate &, const res::AttemptContext &) {
      return inferguard::common::Result<std::string>::success("ok");
    };
    inferguard::bench::run_bench("fallback_concurrent_4x25", 50, [&] {
      std::vector<std::thread> threads;
      for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
          for (int i = 0; i < 25; ++i) {
            (void)orchestrator->execute_with_fallback("bench", candidates, fn);
          }
        });
      }
      for (auto &thread : threads) {
        thread.join();
      }
    });
  }
}
