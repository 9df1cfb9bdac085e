#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace forkyard::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] std::string_view log_level_name(LogLevel level);
[[nodiscard]] LogLevel parse_log_level(std::string_view text);

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

/// Lifecycle transition of a queued job: waiting, active, completed, failed.
struct JobEvent {
  std::string job_id;
  std::string kind;
  std::string state;
  std::string detail;
};

struct WorkspaceEvent {
  std::string action;
  std::string path;
  std::string branch;
  bool success = false;
};

struct ReconcileEvent {
  std::string operation;
  std::string workspace_path;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct SessionEvent {
  std::string session_id;
  std::string action;
  std::string status;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LogEvent, JobEvent, WorkspaceEvent, ReconcileEvent,
                                   SessionEvent, ErrorEvent>;

struct QueueDepthMetric {
  std::string kind;
  std::uint64_t depth = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct GitCommandLatencyMetric {
  std::string subcommand;
  std::chrono::milliseconds latency{0};
  int exit_code = 0;
};

using ObserverMetric = std::variant<QueueDepthMetric, ActiveSessionsMetric, GitCommandLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace forkyard::observability
