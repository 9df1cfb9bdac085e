#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/store.hpp"
#include "forkyard/workspace/manager.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace forkyard::naming {

struct ResolvedNames {
  std::string display_name;
  std::string workspace_name;
};

/// Picks display and workspace names that collide with nothing in the store or on disk.
/// Callers hold the session-creation lock from resolve() until the session row is persisted.
class NameResolver {
public:
  NameResolver(std::shared_ptr<sessions::SessionStore> store,
               std::shared_ptr<workspace::WorkspaceManager> workspaces);

  /// A batch index i adds " <i+1>" / "-<i+1>"; a collision then appends a shared counter to
  /// both names until all three checks pass.
  [[nodiscard]] common::Result<ResolvedNames>
  resolve(const std::string &base_display, const std::string &base_workspace,
          const sessions::Project &project,
          std::optional<std::uint32_t> index = std::nullopt) const;

private:
  [[nodiscard]] common::Result<bool> taken(const ResolvedNames &names,
                                           const sessions::Project &project) const;

  std::shared_ptr<sessions::SessionStore> store_;
  std::shared_ptr<workspace::WorkspaceManager> workspaces_;
};

} // namespace forkyard::naming
