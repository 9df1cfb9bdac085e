#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forkyard::sessions {

/// Status as stored in the database.
enum class PersistedStatus { Pending, Running, Stopped, Completed, Failed };

/// Status shown to users; see state_machine.hpp for the mapping.
enum class VisibleStatus { Initializing, Running, CompletedUnviewed, Stopped, Error };

enum class ToolKind { Claude, Codex, None };

/// disabled, checkpoint after every prompt, or agent-managed structured commits.
enum class CommitMode { Disabled, Checkpoint, Structured };

[[nodiscard]] std::string_view to_string(PersistedStatus status);
[[nodiscard]] std::string_view to_string(VisibleStatus status);
[[nodiscard]] std::string_view to_string(ToolKind tool);
[[nodiscard]] std::string_view to_string(CommitMode mode);

[[nodiscard]] std::optional<PersistedStatus> parse_persisted_status(std::string_view text);
[[nodiscard]] std::optional<VisibleStatus> parse_visible_status(std::string_view text);
[[nodiscard]] std::optional<ToolKind> parse_tool_kind(std::string_view text);
[[nodiscard]] std::optional<CommitMode> parse_commit_mode(std::string_view text);

struct Project {
  std::int64_t id = 0;
  std::string name;
  std::string path;
  std::optional<std::string> worktree_folder;
  /// Newline separated shell commands run in a fresh workspace.
  std::optional<std::string> build_script;
  std::optional<std::string> main_branch;
  bool active = false;
  std::string created_at;
};

struct Folder {
  std::string id;
  std::string name;
  std::int64_t project_id = 0;
  std::string created_at;
};

struct Session {
  std::string id;
  std::string name;
  std::string workspace_name;
  std::string workspace_path;
  std::string initial_prompt;
  std::string base_branch;
  std::string base_commit;
  PersistedStatus status = PersistedStatus::Pending;
  std::int64_t project_id = 0;
  std::optional<std::string> folder_id;
  ToolKind tool = ToolKind::Claude;
  CommitMode commit_mode = CommitMode::Checkpoint;
  bool auto_commit = true;
  bool archived = false;
  std::optional<std::string> last_viewed_at;
  std::string created_at;
  std::string updated_at;
  std::string status_message;
};

struct ExecutionDiff {
  std::int64_t id = 0;
  std::string session_id;
  std::int64_t sequence = 0;
  std::string diff;
  std::vector<std::string> files_changed;
  std::int64_t additions = 0;
  std::int64_t deletions = 0;
  std::int64_t files_changed_count = 0;
  std::string before_commit;
  std::string after_commit;
  std::string created_at;
};

struct ConversationMessage {
  std::int64_t id = 0;
  std::string session_id;
  /// Agent panel the message belongs to; empty for session-scoped history.
  std::optional<std::string> panel_id;
  /// "user" or "assistant".
  std::string role;
  std::string content;
  std::string created_at;
};

} // namespace forkyard::sessions
