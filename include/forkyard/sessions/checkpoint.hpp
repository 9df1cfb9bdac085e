#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/session.hpp"
#include "forkyard/workspace/git.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace forkyard::sessions {

inline constexpr const char *kCheckpointPrefix = "checkpoint: ";

/// "checkpoint: <first prompt line>", or "checkpoint: execution <n>" without a prompt.
/// The part after the prefix is cut to 50 characters.
[[nodiscard]] std::string checkpoint_message(const std::string &prompt, std::int64_t sequence);

/// Stages and commits everything in the session's workspace when the session uses
/// checkpoint commits with auto-commit on. Returns the new commit, or nothing when the
/// session commits by other means or the tree is clean.
[[nodiscard]] common::Result<std::optional<std::string>>
commit_checkpoint(const workspace::GitRunner &git, const Session &session,
                  const std::string &message);

} // namespace forkyard::sessions
