#include "inferguard/providers/reliable.hpp"

#include <algorithm>

namespace inferguard::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<resilience::Orchestrator> orchestrator,
                                   ClientTable clients, std::string operation)
    : orchestrator_(std::move(orchestrator)), clients_(std::move(clients)),
      operation_(std::move(operation)) {}

common::Result<std::string> ReliableProvider::complete(const InferenceRequest &request) {
  auto result = complete_with(request, {}, operation_);
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error().to_string());
  }
  return common::Result<std::string>::success(std::move(result.value()));
}

std::vector<registry::Candidate>
ReliableProvider::candidates_for(const InferenceRequest &request,
                                 registry::CapabilityRequirement requirement) const {
  if (request.image_base64.has_value()) {
    requirement.vision = true;
  }
  auto candidates = orchestrator_->registry().rank_candidates(requirement);
  if (!request.model.empty()) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const registry::Candidate &candidate) {
                                      return candidate.model != request.model;
                                    }),
                     candidates.end());
  }
  return candidates;
}

resilience::CacheParams ReliableProvider::cache_params_for(const InferenceRequest &request) {
  resilience::CacheParams params;
  params["prompt"] = request.prompt;
  if (request.system_prompt.has_value()) {
    params["system_prompt"] = *request.system_prompt;
  }
  if (request.image_base64.has_value()) {
    params["image"] = *request.image_base64;
  }
  if (!request.model.empty()) {
    params["model"] = request.model;
  }
  if (request.max_tokens.has_value()) {
    params["max_tokens"] = std::to_string(*request.max_tokens);
  }
  params["temperature"] = std::to_string(request.temperature);
  return params;
}

common::Result<std::string, resilience::FallbackFailure>
ReliableProvider::complete_with(const InferenceRequest &request,
                                registry::CapabilityRequirement requirement,
                                const std::string &operation,
                                const resilience::ExecuteOptions &options) {
  const auto candidates = candidates_for(request, std::move(requirement));

  // Captured by value: a timed-out attempt may still be running after we return.
  resilience::RequestFn request_fn =
      [clients = clients_, request](const registry::Candidate &candidate,
                                    const resilience::AttemptContext &context)
      -> common::Result<std::string> {
    const auto it = clients.find(candidate.provider);
    if (it == clients.end() || it->second.empty()) {
      return common::Result<std::string>::failure("no client configured for provider " +
                                                  candidate.provider);
    }
    const auto &credentials = it->second;
    const std::size_t index = std::min(context.credential_index, credentials.size() - 1);

    InferenceRequest call = request;
    call.model = candidate.model;
    call.timeout = context.timeout;
    return credentials[index]->complete(call);
  };

  return orchestrator_->execute_with_fallback(operation, candidates, request_fn,
                                              cache_params_for(request), options);
}

common::Status ReliableProvider::warmup() {
  std::string errors;
  for (const auto &name : orchestrator_->registry().provider_order()) {
    const auto it = clients_.find(name);
    if (it == clients_.end() || it->second.empty()) {
      continue;
    }
    const auto status = it->second.front()->warmup();
    if (status.ok()) {
      return common::Status::success();
    }
    if (!errors.empty()) {
      errors += "; ";
    }
    errors += name + ": " + status.error();
  }
  if (errors.empty()) {
    return common::Status::error("no providers configured");
  }
  return common::Status::error(errors);
}

std::string ReliableProvider::name() const { return "reliable"; }

} // namespace inferguard::providers
