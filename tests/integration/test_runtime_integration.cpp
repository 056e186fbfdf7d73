#include "test_framework.hpp"

#include "inferguard/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

void register_runtime_integration_tests(std::vector<inferguard::tests::TestCase> &tests) {
  using inferguard::tests::require;
  namespace rt = inferguard::runtime;
  using inferguard::testing::ok;
  using inferguard::testing::ScriptedProvider;

  tests.push_back({"runtime_integration_builds_stack", [] {
                     rt::RuntimeContext context(inferguard::testing::mock_config(),
                                                std::make_shared<inferguard::testing::ManualClock>());
                     auto stack = context.create_stack_with_clients(
                         {{"alpha", {ScriptedProvider::always(ok("a"), "alpha")}},
                          {"beta", {ScriptedProvider::always(ok("b"), "beta")}}});
                     require(stack.ok(), stack.error_message());
                     const auto &built = *stack.value();
                     require(built.registry->providers().size() == 2, "registry");
                     require(built.tracker && built.cache && built.history, "components");
                     require(built.orchestrator && built.provider, "orchestrator and facade");
                     require(built.health == nullptr, "health disabled in config");
                     auto answer = built.provider->complete({.prompt = "x"});
                     require(answer.ok() && answer.value() == "a", answer.error_message());
                   }});

  tests.push_back({"runtime_integration_rejects_invalid_config", [] {
                     auto config = inferguard::testing::mock_config();
                     config.providers.clear();
                     rt::RuntimeContext context(config);
                     auto stack = context.create_stack_with_clients({});
                     require(!stack.ok(), "empty catalogue must fail");
                     require(stack.error().rfind("invalid config:", 0) == 0, stack.error());
                   }});

  tests.push_back({"runtime_integration_registers_health_probes", [] {
                     auto config = inferguard::testing::mock_config();
                     config.health.enabled = true;
                     rt::RuntimeContext context(config,
                                                std::make_shared<inferguard::testing::ManualClock>());
                     auto alpha = ScriptedProvider::always(ok("pong"), "alpha");
                     auto beta = ScriptedProvider::always(ok("pong"), "beta");
                     auto stack = context.create_stack_with_clients({{"alpha", {alpha}},
                                                                     {"beta", {beta}}});
                     require(stack.ok(), stack.error_message());
                     auto &monitor = *stack.value()->health;
                     require(!monitor.is_running(), "probing is not started automatically");
                     monitor.check_stale();

                     const auto report = monitor.get_status_report();
                     require(report.size() == 2, "both providers registered");
                     require(report[0].probe_model == "alpha-vision", "preferred model probed");
                     require(alpha->requests().at(0).image_base64.has_value(),
                             "vision model probed with an image");
                     require(!beta->requests().at(0).image_base64.has_value(),
                             "text model probed without one");
                     require(monitor.get_healthy_provider({"beta", "alpha"}) == std::optional<std::string>("beta"),
                             "preference order honoured");
                   }});

  tests.push_back({"runtime_integration_http_clients_from_catalogue", [] {
                     inferguard::testing::set_test_env("ALPHA_API_KEY", "alpha-secret");
                     auto http = std::make_shared<inferguard::testing::MockHttpClient>();
                     http->next_post = {.status = 200,
                                        .body = R"({"choices":[{"message":{"content":"via http"}}]})"};
                     rt::RuntimeContext context(inferguard::testing::mock_config(),
                                                std::make_shared<inferguard::testing::ManualClock>());
                     auto stack = context.create_stack(http);
                     inferguard::testing::unset_test_env("ALPHA_API_KEY");
                     require(stack.ok(), stack.error_message());
                     require(stack.value()->clients.at("alpha").size() == 1, "one credential");

                     auto answer = stack.value()->provider->complete({.prompt = "x"});
                     require(answer.ok() && answer.value() == "via http", answer.error_message());
                     require(http->last_url == "https://alpha.example.com/v1/chat/completions",
                             http->last_url);
                     require(http->last_headers.at("Authorization") == "Bearer alpha-secret",
                             "key read at construction");
                   }});

  tests.push_back({"runtime_integration_option_mapping", [] {
                     auto config = inferguard::testing::mock_config();
                     config.resilience.attempt_timeout_ms = 1234;
                     config.circuit_breaker.failure_threshold = 7;
                     config.backoff.max_seconds = 90.0;
                     config.cache.ttl_seconds = 42;
                     config.health.failure_threshold = 4;
                     const auto options = rt::RuntimeContext::orchestrator_options(config);
                     require(options.attempt_timeout == std::chrono::milliseconds(1234), "timeout");
                     require(options.breaker.failure_threshold == 7, "breaker");
                     require(options.backoff.max_seconds == 90.0, "backoff");
                     require(rt::RuntimeContext::cache_options(config).ttl == std::chrono::seconds(42),
                             "cache ttl");
                     require(rt::RuntimeContext::health_options(config).failure_threshold == 4,
                             "health threshold");
                   }});
}
