#include "tests/helpers/test_helpers.hpp"

#include "inferguard/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <thread>

namespace inferguard::testing {

config::Config mock_config() {
  config::Config config;
  config.observability.backend = "none";
  config.health.enabled = false;

  config::ProviderConfig alpha;
  alpha.name = "alpha";
  alpha.base_url = "https://alpha.example.com/v1";
  alpha.api_key_env = {"ALPHA_API_KEY"};
  alpha.priority = 1;
  config::ModelConfig alpha_model;
  alpha_model.id = "alpha-vision";
  alpha_model.capabilities = {"vision", "analysis"};
  alpha_model.supports_vision = true;
  alpha.models.push_back(alpha_model);

  config::ProviderConfig beta;
  beta.name = "beta";
  beta.base_url = "https://beta.example.com/v1";
  beta.api_key_env = {"BETA_API_KEY"};
  beta.priority = 2;
  config::ModelConfig beta_model;
  beta_model.id = "beta-text";
  beta_model.capabilities = {"reasoning"};
  beta.models.push_back(beta_model);

  config.providers = {alpha, beta};
  return config;
}

ManualClock::ManualClock() : now_(time_point(std::chrono::hours(1000))) {}

common::Clock::time_point ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::sleep_for(const std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delay;
  slept_ += delay;
}

void ManualClock::advance(const duration delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

std::chrono::milliseconds ManualClock::total_slept() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slept_;
}

ScriptedProvider::ScriptedProvider(std::vector<common::Result<std::string>> script, std::string name)
    : script_(std::move(script)), name_(std::move(name)) {}

std::shared_ptr<ScriptedProvider> ScriptedProvider::always(common::Result<std::string> result,
                                                           std::string name) {
  return std::make_shared<ScriptedProvider>(std::vector<common::Result<std::string>>{std::move(result)},
                                            std::move(name));
}

void ScriptedProvider::set_delay(const std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_ = delay;
}

common::Result<std::string> ScriptedProvider::complete(const providers::InferenceRequest &request) {
  std::chrono::milliseconds delay{0};
  common::Result<std::string> result = common::Result<std::string>::failure("empty script");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t index = requests_.size();
    requests_.push_back(request);
    delay = delay_;
    if (!script_.empty()) {
      result = script_[std::min(index, script_.size() - 1)];
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  return result;
}

common::Status ScriptedProvider::warmup() { return common::Status::success(); }

std::size_t ScriptedProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

std::vector<providers::InferenceRequest> ScriptedProvider::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

providers::HttpResponse
MockHttpClient::post_json(const std::string &url,
                          const std::unordered_map<std::string, std::string> &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  last_url = url;
  last_headers = headers;
  last_body = body;
  last_timeout_ms = timeout_ms;
  ++post_count;
  return next_post;
}

providers::HttpResponse
MockHttpClient::get(const std::string &url,
                    const std::unordered_map<std::string, std::string> &headers,
                    const std::uint64_t timeout_ms) {
  last_url = url;
  last_headers = headers;
  last_timeout_ms = timeout_ms;
  return next_get;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

ScopedCapture::ScopedCapture() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedCapture::~ScopedCapture() { observability::set_global_observer(nullptr); }

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("inferguard-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

void set_test_env(const char *name, const char *value) { setenv(name, value, 1); }

void unset_test_env(const char *name) { unsetenv(name); }

common::Result<std::string> ok(std::string text) {
  return common::Result<std::string>::success(std::move(text));
}

common::Result<std::string> fail(std::string text) {
  return common::Result<std::string>::failure(std::move(text));
}

} // namespace inferguard::testing
