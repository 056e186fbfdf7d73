#pragma once

#include "inferguard/config/schema.hpp"
#include "inferguard/observability/observer.hpp"

#include <memory>

namespace inferguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace inferguard::observability
