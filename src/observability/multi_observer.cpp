#include "forkyard/observability/multi_observer.hpp"

#include <algorithm>

namespace forkyard::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  const bool duplicate =
      std::any_of(observers_.begin(), observers_.end(), [&observer](const auto &existing) {
        return existing->name() == observer->name();
      });
  if (duplicate) {
    return false;
  }
  observers_.push_back(std::move(observer));
  return true;
}

std::string MultiObserver::describe() const {
  std::string out;
  for (const auto &observer : observers_) {
    if (!out.empty()) {
      out += '+';
    }
    out += observer->name();
  }
  return out;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace forkyard::observability
