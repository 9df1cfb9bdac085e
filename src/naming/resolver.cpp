#include "forkyard/naming/resolver.hpp"

#include <filesystem>

namespace forkyard::naming {

NameResolver::NameResolver(std::shared_ptr<sessions::SessionStore> store,
                           std::shared_ptr<workspace::WorkspaceManager> workspaces)
    : store_(std::move(store)), workspaces_(std::move(workspaces)) {}

common::Result<bool> NameResolver::taken(const ResolvedNames &names,
                                         const sessions::Project &project) const {
  auto display = store_->display_name_exists(project.id, names.display_name);
  if (!display.ok() || display.value()) {
    return display;
  }
  auto workspace = store_->workspace_name_exists(project.id, names.workspace_name);
  if (!workspace.ok() || workspace.value()) {
    return workspace;
  }
  std::error_code ec;
  const auto path =
      workspaces_->workspace_path(project.path, names.workspace_name, project.worktree_folder);
  return common::Result<bool>::success(std::filesystem::exists(path, ec));
}

common::Result<ResolvedNames> NameResolver::resolve(const std::string &base_display,
                                                    const std::string &base_workspace,
                                                    const sessions::Project &project,
                                                    const std::optional<std::uint32_t> index) const {
  std::string display_stem = base_display;
  std::string workspace_stem = base_workspace;
  if (index.has_value()) {
    display_stem += " " + std::to_string(*index + 1);
    workspace_stem += "-" + std::to_string(*index + 1);
  }

  ResolvedNames candidate{.display_name = display_stem, .workspace_name = workspace_stem};
  for (std::uint64_t counter = 1;; ++counter) {
    auto collision = taken(candidate, project);
    if (!collision.ok()) {
      return common::Result<ResolvedNames>::failure(collision.details());
    }
    if (!collision.value()) {
      return common::Result<ResolvedNames>::success(std::move(candidate));
    }
    candidate.display_name = display_stem + " " + std::to_string(counter);
    candidate.workspace_name = workspace_stem + "-" + std::to_string(counter);
  }
}

} // namespace forkyard::naming
