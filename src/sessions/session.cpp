#include "forkyard/sessions/session.hpp"

namespace forkyard::sessions {

std::string_view to_string(const PersistedStatus status) {
  switch (status) {
  case PersistedStatus::Pending:
    return "pending";
  case PersistedStatus::Running:
    return "running";
  case PersistedStatus::Stopped:
    return "stopped";
  case PersistedStatus::Completed:
    return "completed";
  case PersistedStatus::Failed:
    return "failed";
  }
  return "pending";
}

std::string_view to_string(const VisibleStatus status) {
  switch (status) {
  case VisibleStatus::Initializing:
    return "initializing";
  case VisibleStatus::Running:
    return "running";
  case VisibleStatus::CompletedUnviewed:
    return "completed_unviewed";
  case VisibleStatus::Stopped:
    return "stopped";
  case VisibleStatus::Error:
    return "error";
  }
  return "initializing";
}

std::string_view to_string(const ToolKind tool) {
  switch (tool) {
  case ToolKind::Claude:
    return "claude";
  case ToolKind::Codex:
    return "codex";
  case ToolKind::None:
    return "none";
  }
  return "none";
}

std::string_view to_string(const CommitMode mode) {
  switch (mode) {
  case CommitMode::Disabled:
    return "disabled";
  case CommitMode::Checkpoint:
    return "checkpoint";
  case CommitMode::Structured:
    return "structured";
  }
  return "disabled";
}

std::optional<PersistedStatus> parse_persisted_status(const std::string_view text) {
  for (const auto status : {PersistedStatus::Pending, PersistedStatus::Running,
                            PersistedStatus::Stopped, PersistedStatus::Completed,
                            PersistedStatus::Failed}) {
    if (to_string(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<VisibleStatus> parse_visible_status(const std::string_view text) {
  for (const auto status : {VisibleStatus::Initializing, VisibleStatus::Running,
                            VisibleStatus::CompletedUnviewed, VisibleStatus::Stopped,
                            VisibleStatus::Error}) {
    if (to_string(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<ToolKind> parse_tool_kind(const std::string_view text) {
  for (const auto tool : {ToolKind::Claude, ToolKind::Codex, ToolKind::None}) {
    if (to_string(tool) == text) {
      return tool;
    }
  }
  return std::nullopt;
}

std::optional<CommitMode> parse_commit_mode(const std::string_view text) {
  for (const auto mode : {CommitMode::Disabled, CommitMode::Checkpoint, CommitMode::Structured}) {
    if (to_string(mode) == text) {
      return mode;
    }
  }
  return std::nullopt;
}

} // namespace forkyard::sessions
