#include "forkyard/observability/global.hpp"

#include <mutex>

namespace forkyard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_job(const std::string &job_id, const std::string &kind, const std::string &state,
                const std::string &detail) {
  record_event(JobEvent{.job_id = job_id, .kind = kind, .state = state, .detail = detail});
}

void record_workspace(const std::string &action, const std::string &path,
                      const std::string &branch, const bool success) {
  record_event(
      WorkspaceEvent{.action = action, .path = path, .branch = branch, .success = success});
}

void record_reconcile(const std::string &operation, const std::string &workspace_path,
                      const std::chrono::milliseconds duration, const bool success) {
  record_event(ReconcileEvent{.operation = operation,
                              .workspace_path = workspace_path,
                              .duration = duration,
                              .success = success});
}

void record_session(const std::string &session_id, const std::string &action,
                    const std::string &status) {
  record_event(SessionEvent{.session_id = session_id, .action = action, .status = status});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Debug, .component = component, .message = message});
}

void log_info(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Info, .component = component, .message = message});
}

void log_warn(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Warn, .component = component, .message = message});
}

void log_error(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Error, .component = component, .message = message});
}

} // namespace forkyard::observability
