#include "forkyard/observability/factory.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/observability/log_observer.hpp"
#include "forkyard/observability/multi_observer.hpp"
#include "forkyard/observability/noop_observer.hpp"

#include <sstream>

namespace forkyard::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const LogLevel level) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

// "log, noop" style lists; unknown and repeated entries are dropped.
std::unique_ptr<IObserver> create_list(const std::string &backends, const LogLevel level) {
  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backends);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(create_single(common::trim(part), level));
  }
  if (multi->empty()) {
    return std::make_unique<LogObserver>(level);
  }
  return multi;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }
  const LogLevel level = parse_log_level(common::to_lower(config.observability.level));
  if (backend.find(',') != std::string::npos) {
    return create_list(backend, level);
  }
  if (auto single = create_single(backend, level); single != nullptr) {
    return single;
  }
  return std::make_unique<LogObserver>(level);
}

} // namespace forkyard::observability
