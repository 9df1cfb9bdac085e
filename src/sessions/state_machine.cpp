#include "forkyard/sessions/state_machine.hpp"

namespace forkyard::sessions {

VisibleStatus visible_status(const PersistedStatus status,
                             const std::optional<std::string> &last_viewed_at,
                             const std::string &updated_at) {
  switch (status) {
  case PersistedStatus::Pending:
    return VisibleStatus::Initializing;
  case PersistedStatus::Running:
    return VisibleStatus::Running;
  case PersistedStatus::Failed:
    return VisibleStatus::Error;
  case PersistedStatus::Stopped:
  case PersistedStatus::Completed:
    // Timestamps share one fixed-width UTC format, so string order is time order.
    if (!last_viewed_at.has_value() || *last_viewed_at < updated_at) {
      return VisibleStatus::CompletedUnviewed;
    }
    return VisibleStatus::Stopped;
  }
  return VisibleStatus::Error;
}

VisibleStatus visible_status(const Session &session) {
  return visible_status(session.status, session.last_viewed_at, session.updated_at);
}

PersistedStatus persisted_status(const VisibleStatus status) {
  switch (status) {
  case VisibleStatus::Initializing:
    return PersistedStatus::Pending;
  case VisibleStatus::Running:
    return PersistedStatus::Running;
  case VisibleStatus::CompletedUnviewed:
  case VisibleStatus::Stopped:
    return PersistedStatus::Stopped;
  case VisibleStatus::Error:
    return PersistedStatus::Failed;
  }
  return PersistedStatus::Failed;
}

bool is_active(const PersistedStatus status) {
  return status == PersistedStatus::Running || status == PersistedStatus::Pending;
}

} // namespace forkyard::sessions
