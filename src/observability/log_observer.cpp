#include "forkyard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace forkyard::observability {

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string_view text) {
  if (text == "debug") {
    return LogLevel::Debug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::Warn;
  }
  if (text == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out != nullptr ? out : &std::cerr) {}

void LogObserver::line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          line(evt.level, evt.component.empty() ? evt.message : evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, JobEvent>) {
          const LogLevel level = evt.state == "failed" ? LogLevel::Warn : LogLevel::Debug;
          line(level, "job." + evt.state + " id=" + evt.job_id + " kind=" + evt.kind +
                          (evt.detail.empty() ? "" : " detail=" + evt.detail));
        } else if constexpr (std::is_same_v<T, WorkspaceEvent>) {
          line(evt.success ? LogLevel::Info : LogLevel::Warn,
               "workspace." + evt.action + " path=" + evt.path + " branch=" + evt.branch +
                   " success=" + (evt.success ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, ReconcileEvent>) {
          line(evt.success ? LogLevel::Info : LogLevel::Warn,
               "reconcile." + evt.operation + " path=" + evt.workspace_path +
                   " duration_ms=" + std::to_string(evt.duration.count()) +
                   " success=" + (evt.success ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          line(LogLevel::Info,
               "session." + evt.action + " id=" + evt.session_id + " status=" + evt.status);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          line(LogLevel::Debug, "metric.queue_depth kind=" + m.kind +
                                    " depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, GitCommandLatencyMetric>) {
          line(LogLevel::Debug, "metric.git_latency_ms command=" + m.subcommand + " value=" +
                                    std::to_string(m.latency.count()) +
                                    " exit=" + std::to_string(m.exit_code));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace forkyard::observability
