#pragma once

#include "forkyard/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace forkyard::observability {

/// Fans every event out to its children. A backend name is only added once.
class MultiObserver final : public IObserver {
public:
  /// Returns false for a null observer or a backend already present.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] bool empty() const { return observers_.empty(); }
  /// Child backend names joined with '+', e.g. "log+noop".
  [[nodiscard]] std::string describe() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace forkyard::observability
