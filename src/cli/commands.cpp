#include "inferguard/cli/commands.hpp"

#include "inferguard/common/fs.hpp"
#include "inferguard/common/hash.hpp"
#include "inferguard/config/config.hpp"
#include "inferguard/registry/model_registry.hpp"
#include "inferguard/runtime/app.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace inferguard::cli {

namespace {

std::string version_string() {
#ifdef INFERGUARD_VERSION
  std::string version = INFERGUARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "inferguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string image_mime_type(const std::filesystem::path &path) {
  const std::string extension = common::to_lower(path.extension().string());
  if (extension == ".jpg" || extension == ".jpeg") {
    return "image/jpeg";
  }
  if (extension == ".webp") {
    return "image/webp";
  }
  if (extension == ".gif") {
    return "image/gif";
  }
  return "image/png";
}

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << separator;
    }
    out << values[i];
  }
  return out.str();
}

common::Result<std::shared_ptr<runtime::ResilienceStack>> build_stack() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return common::Result<std::shared_ptr<runtime::ResilienceStack>>::failure(context.error());
  }
  return context.value().create_stack();
}

int run_catalog(std::vector<std::string> args) {
  registry::CapabilityRequirement requirement;
  requirement.vision = take_flag(args, "--vision");
  requirement.capabilities = take_repeated_option(args, "--capability");
  requirement.providers = take_repeated_option(args, "--provider");
  std::string min_context;
  if (take_option(args, "--min-context", "", min_context)) {
    try {
      requirement.min_context_length = std::stoull(min_context);
    } catch (const std::exception &) {
      std::cerr << "invalid --min-context: " << min_context << "\n";
      return 1;
    }
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto registry = registry::ModelRegistry::from_config(cfg.value());
  if (!registry.ok()) {
    std::cerr << registry.error() << "\n";
    return 1;
  }

  const auto candidates = registry.value().rank_candidates(requirement);
  if (candidates.empty()) {
    std::cout << "No eligible models.\n";
    return 0;
  }
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto &candidate = candidates[i];
    const auto *model = registry.value().find_model(candidate.provider, candidate.model);
    std::cout << std::setw(3) << (i + 1) << ". " << candidate.provider << "/" << candidate.model;
    if (model != nullptr) {
      std::cout << "  ctx=" << model->context_length << " rpm=" << model->requests_per_minute
                << " rpd=" << model->requests_per_day << " priority=" << model->priority;
      if (model->supports_vision) {
        std::cout << " vision";
      }
      if (!model->capabilities.empty()) {
        std::cout << " [" << join(model->capabilities, ",") << "]";
      }
    }
    std::cout << "\n";
  }
  return 0;
}

int run_ask(std::vector<std::string> args) {
  std::string message;
  std::string image_path;
  std::string operation = "ask";
  std::string model;
  std::string system_prompt;
  std::string timeout_raw;
  std::string budget_raw;
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--image", "-i", image_path);
  (void)take_option(args, "--operation", "", operation);
  (void)take_option(args, "--model", "", model);
  (void)take_option(args, "--system", "", system_prompt);
  (void)take_option(args, "--timeout-ms", "", timeout_raw);
  (void)take_option(args, "--budget-ms", "", budget_raw);
  const bool no_cache = take_flag(args, "--no-cache");

  registry::CapabilityRequirement requirement;
  requirement.capabilities = take_repeated_option(args, "--capability");
  requirement.providers = take_repeated_option(args, "--provider");

  if (message.empty()) {
    std::cerr << "usage: inferguard ask -m MESSAGE [--image FILE] [--operation NAME]\n";
    return 1;
  }

  providers::InferenceRequest request;
  request.prompt = message;
  request.model = model;
  if (!system_prompt.empty()) {
    request.system_prompt = system_prompt;
  }
  if (!image_path.empty()) {
    const auto bytes = common::read_file(common::expand_path(image_path));
    if (!bytes.ok()) {
      std::cerr << bytes.error() << "\n";
      return 1;
    }
    request.image_base64 = common::base64_encode(bytes.value());
    request.image_mime_type = image_mime_type(image_path);
  }

  resilience::ExecuteOptions options;
  options.use_cache = !no_cache;
  try {
    if (!timeout_raw.empty()) {
      options.attempt_timeout = std::chrono::milliseconds(std::stoll(timeout_raw));
    }
    if (!budget_raw.empty()) {
      options.overall_budget = std::chrono::milliseconds(std::stoll(budget_raw));
    }
  } catch (const std::exception &) {
    std::cerr << "invalid duration: " << (timeout_raw.empty() ? budget_raw : timeout_raw) << "\n";
    return 1;
  }

  auto stack = build_stack();
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }

  auto result = stack.value()->provider->complete_with(request, requirement, operation, options);
  if (!result.ok()) {
    std::cerr << result.error().to_string() << "\n";
    return result.error().invalid_request ? 2 : 1;
  }
  std::cout << result.value() << "\n";
  return 0;
}

int run_health(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  auto stack = build_stack();
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }
  if (stack.value()->health == nullptr) {
    std::cerr << "health monitoring is disabled in config\n";
    return 1;
  }

  auto &monitor = *stack.value()->health;
  monitor.check_stale();
  if (json) {
    std::cout << monitor.status_report_json() << "\n";
    return 0;
  }

  bool any_available = false;
  for (const auto &entry : monitor.get_status_report()) {
    any_available = any_available || entry.available();
    std::cout << std::left << std::setw(20) << entry.provider << std::setw(11)
              << health::health_status_name(entry.status) << entry.probe_model;
    if (entry.last_error.has_value()) {
      std::cout << "  " << *entry.last_error;
    }
    std::cout << "\n";
  }
  return any_available ? 0 : 1;
}

int run_status(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  auto stack = build_stack();
  if (!stack.ok()) {
    std::cerr << stack.error() << "\n";
    return 1;
  }

  const auto &orchestrator = *stack.value()->orchestrator;
  if (json) {
    std::cout << orchestrator.provider_stats_json() << "\n";
    return 0;
  }
  for (const auto &stats : orchestrator.get_provider_stats()) {
    std::cout << stats.name << " (" << stats.status << ", priority " << stats.priority << ")\n";
    std::cout << "  limits: rpm=" << stats.requests_per_minute_limit
              << " rpd=" << stats.requests_per_day_limit << " burst=" << stats.burst_limit << "\n";
    std::cout << "  window: minute=" << stats.requests_last_minute
              << " hour=" << stats.requests_last_hour << " day=" << stats.requests_today << "\n";
    std::cout << "  circuit: " << stats.circuit_state << " failures=" << stats.circuit_failures
              << " backoff_attempt=" << stats.backoff_attempt << "\n";
    std::cout << "  credentials: " << stats.credentials_available << "/" << stats.credentials_total
              << "  models: " << stats.models.size() << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (action == "validate") {
    const auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      for (const auto &problem : common::split(validation.error(), ';')) {
        std::cerr << "[FAIL] " << problem << "\n";
      }
      return 1;
    }
    for (const auto &warning : validation.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] " << cfg.value().providers.size() << " providers\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  inferguard [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  catalog [--vision] [--capability C] [--provider P] [--min-context N]\n";
  std::cout << "                   List eligible models in fallback order\n";
  std::cout << "  ask -m MSG [--image FILE] [--operation NAME] [--model ID] [--system TEXT]\n";
  std::cout << "      [--capability C] [--provider P] [--timeout-ms N] [--budget-ms N] [--no-cache]\n";
  std::cout << "                   Send one request through the fallback chain\n";
  std::cout << "  health [--json]  Probe every provider once and print its status\n";
  std::cout << "  status [--json]  Print per-provider limits, windows and circuit state\n";
  std::cout << "  config show      Print the effective configuration\n";
  std::cout << "  config validate  Check the configuration for problems\n";
  std::cout << "  config path      Print the configuration file path\n";
  std::cout << "  version          Print the version\n";
  std::cout << "  help             Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "catalog") {
    return run_catalog(std::move(args));
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "health") {
    return run_health(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace inferguard::cli
