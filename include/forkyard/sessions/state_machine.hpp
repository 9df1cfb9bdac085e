#pragma once

#include "forkyard/sessions/session.hpp"

#include <optional>
#include <string>

namespace forkyard::sessions {

/// pending -> initializing, running -> running, failed -> error. stopped and completed read as
/// completed_unviewed until the session is viewed at or after its last update.
[[nodiscard]] VisibleStatus visible_status(PersistedStatus status,
                                           const std::optional<std::string> &last_viewed_at,
                                           const std::string &updated_at);
[[nodiscard]] VisibleStatus visible_status(const Session &session);

/// Status to persist when a caller asks for a visible status.
[[nodiscard]] PersistedStatus persisted_status(VisibleStatus status);

/// Sessions still active after a restart are no longer backed by a process.
[[nodiscard]] bool is_active(PersistedStatus status);

} // namespace forkyard::sessions
