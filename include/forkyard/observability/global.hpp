#pragma once

#include "forkyard/observability/observer.hpp"

#include <memory>

namespace forkyard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_job(const std::string &job_id, const std::string &kind, const std::string &state,
                const std::string &detail = "");
void record_workspace(const std::string &action, const std::string &path,
                      const std::string &branch, bool success);
void record_reconcile(const std::string &operation, const std::string &workspace_path,
                      std::chrono::milliseconds duration, bool success);
void record_session(const std::string &session_id, const std::string &action,
                    const std::string &status);
void record_error(const std::string &component, const std::string &message);

void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);
void log_error(const std::string &component, const std::string &message);

} // namespace forkyard::observability
