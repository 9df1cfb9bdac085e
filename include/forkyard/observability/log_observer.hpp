#pragma once

#include "forkyard/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace forkyard::observability {

/// Writes "[LEVEL] message" lines; defaults to stderr.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream *out = nullptr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace forkyard::observability
