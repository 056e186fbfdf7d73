#pragma once

#include "inferguard/providers/factory.hpp"
#include "inferguard/providers/traits.hpp"
#include "inferguard/resilience/orchestrator.hpp"

#include <memory>
#include <string>

namespace inferguard::providers {

/// Presents the whole resilient layer as a single client: every call is routed through
/// the orchestrator across the registry's ranked candidates.
class ReliableProvider final : public Provider {
public:
  ReliableProvider(std::shared_ptr<resilience::Orchestrator> orchestrator, ClientTable clients,
                   std::string operation = "complete");

  /// Fails with the aggregated fallback failure rendered as text.
  [[nodiscard]] common::Result<std::string> complete(const InferenceRequest &request) override;

  /// A non-empty `request.model` restricts candidates to models with that id; an image
  /// adds the vision requirement.
  [[nodiscard]] common::Result<std::string, resilience::FallbackFailure>
  complete_with(const InferenceRequest &request, registry::CapabilityRequirement requirement,
                const std::string &operation, const resilience::ExecuteOptions &options = {});

  [[nodiscard]] std::vector<registry::Candidate>
  candidates_for(const InferenceRequest &request, registry::CapabilityRequirement requirement) const;

  [[nodiscard]] static resilience::CacheParams cache_params_for(const InferenceRequest &request);

  /// Succeeds when at least one provider's first credential answers.
  [[nodiscard]] common::Status warmup() override;
  [[nodiscard]] std::string name() const override;

private:
  std::shared_ptr<resilience::Orchestrator> orchestrator_;
  ClientTable clients_;
  std::string operation_;
};

} // namespace inferguard::providers
