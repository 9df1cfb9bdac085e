#pragma once

#include "forkyard/config/schema.hpp"
#include "forkyard/observability/observer.hpp"

#include <memory>

namespace forkyard::observability {

/// Backend names: "log", "none"/"noop", or a comma separated list of those. Unknown names
/// fall back to "log"; a list with no known entry does too.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace forkyard::observability
