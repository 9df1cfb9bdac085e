#include "test_framework.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/sync/mutex_registry.hpp"
#include "forkyard/workspace/manager.hpp"
#include "forkyard/workspace/reconcile.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

namespace {

namespace ws = forkyard::workspace;

/// Project on main plus one worktree "feature" branched from it.
struct ReconcileFixture {
  forkyard::testing::TempWorkspace temp;
  std::filesystem::path root;
  std::filesystem::path workspace;
  std::shared_ptr<ws::GitRunner> git;
  std::shared_ptr<forkyard::sync::MutexRegistry> locks;
  ws::Reconciler reconciler;

  explicit ReconcileFixture(ws::ReconcileOptions options = {})
      : root(temp.path() / "project"), git(std::make_shared<ws::GitRunner>()),
        locks(std::make_shared<forkyard::sync::MutexRegistry>()),
        reconciler(git, locks, options) {
    forkyard::testing::init_repository(root);
    ws::WorkspaceManager manager(git);
    auto created = manager.create(root, "feature");
    if (!created.ok()) {
      throw std::runtime_error("worktree setup failed: " + created.error());
    }
    workspace = created.value().path;
  }
};

std::string count_commits(const std::filesystem::path &repo, const std::string &ref) {
  return forkyard::testing::git(repo, {"rev-list", "--count", ref});
}

} // namespace

void register_reconcile_tests(std::vector<forkyard::tests::TestCase> &tests) {
  using forkyard::tests::require;
  namespace common = forkyard::common;
  using forkyard::testing::commit_file;
  using forkyard::testing::git;

  tests.push_back({"reconcile_detect_conflicts_is_read_only", [] {
                     ReconcileFixture fx;
                     commit_file(fx.workspace, "README.md", "workspace version\n", "Workspace edit");
                     commit_file(fx.root, "README.md", "main version\n", "Main edit");
                     {
                       std::ofstream scratch(fx.workspace / "scratch.txt");
                       scratch << "uncommitted";
                     }
                     const auto head_before = git(fx.workspace, {"rev-parse", "HEAD"});
                     const auto status_before = git(fx.workspace, {"status", "--porcelain"});

                     auto report = fx.reconciler.detect_conflicts(fx.workspace, "main");
                     require(report.ok(), report.error());
                     require(report.value().has_conflicts, "both sides edited README");
                     require(!report.value().can_auto_merge, "conflicts cannot auto merge");
                     require(report.value().conflicting_files == std::vector<std::string>{"README.md"},
                             "README should be the conflicting file");
                     require(report.value().ours_commits.size() == 1, "one workspace commit");
                     require(report.value().theirs_commits.size() == 1, "one main commit");

                     require(git(fx.workspace, {"rev-parse", "HEAD"}) == head_before, "HEAD moved");
                     require(git(fx.workspace, {"status", "--porcelain"}) == status_before,
                             "working tree or index changed");
                   }});

  tests.push_back({"reconcile_detect_conflicts_clean_cases", [] {
                     ReconcileFixture fx;
                     auto up_to_date = fx.reconciler.detect_conflicts(fx.workspace, "main");
                     require(up_to_date.ok(), up_to_date.error());
                     require(!up_to_date.value().has_conflicts, "identical branches do not conflict");

                     commit_file(fx.workspace, "feature.txt", "feature\n", "Feature file");
                     commit_file(fx.root, "main.txt", "main\n", "Main file");
                     auto disjoint = fx.reconciler.detect_conflicts(fx.workspace, "main");
                     require(disjoint.ok(), disjoint.error());
                     require(!disjoint.value().has_conflicts, "disjoint files do not conflict");
                     require(disjoint.value().can_auto_merge, "disjoint files auto merge");
                     require(disjoint.value().conflicting_files.empty(), "no conflicting files");

                     auto changes = fx.reconciler.has_changes(fx.workspace, "main");
                     require(changes.ok() && changes.value(), "main has a commit the workspace lacks");
                   }});

  tests.push_back({"reconcile_detect_conflicts_without_merge_tree_uses_file_overlap", [] {
                     ReconcileFixture fx;
                     const auto old_git = forkyard::testing::write_git_wrapper(
                         fx.temp.path() / "bin" / "git-without-merge-tree",
                         "if [ \"$1\" = merge-tree ]; then echo \"unknown command\" >&2; exit 129; fi");
                     ws::Reconciler fallback(std::make_shared<ws::GitRunner>(old_git.string()),
                                             fx.locks);

                     commit_file(fx.workspace, "README.md", "workspace version\n", "Workspace edit");
                     commit_file(fx.workspace, "feature.txt", "feature\n", "Feature file");
                     commit_file(fx.root, "README.md", "main version\n", "Main edit");
                     const auto head_before = git(fx.workspace, {"rev-parse", "HEAD"});
                     const auto status_before = git(fx.workspace, {"status", "--porcelain"});

                     ws::GitTranscript transcript;
                     auto report = fallback.detect_conflicts(fx.workspace, "main", &transcript);
                     require(report.ok(), report.error());
                     require(report.value().has_conflicts, "overlapping file is a potential conflict");
                     require(!report.value().can_auto_merge, "overlap is never auto merged");
                     require(report.value().conflicting_files == std::vector<std::string>{"README.md"},
                             "only the file changed on both sides is reported");
                     const auto &commands = transcript.commands();
                     require(std::any_of(commands.begin(), commands.end(),
                                         [](const std::string &command) {
                                           return common::contains(command, "merge-tree");
                                         }),
                             "merge-tree attempt is in the transcript");
                     require(git(fx.workspace, {"rev-parse", "HEAD"}) == head_before, "HEAD moved");
                     require(git(fx.workspace, {"status", "--porcelain"}) == status_before,
                             "working tree or index changed");

                     ReconcileFixture disjoint_fx;
                     ws::Reconciler disjoint_fallback(
                         std::make_shared<ws::GitRunner>(old_git.string()), disjoint_fx.locks);
                     commit_file(disjoint_fx.workspace, "feature.txt", "feature\n", "Feature file");
                     commit_file(disjoint_fx.root, "main.txt", "main\n", "Main file");
                     auto disjoint = disjoint_fallback.detect_conflicts(disjoint_fx.workspace, "main");
                     require(disjoint.ok(), disjoint.error());
                     require(!disjoint.value().has_conflicts, "disjoint changes do not conflict");
                     require(disjoint.value().conflicting_files.empty(), "no files reported");
                   }});

  tests.push_back({"reconcile_rebase_main_into_workspace", [] {
                     ReconcileFixture fx;
                     commit_file(fx.workspace, "feature.txt", "feature\n", "Feature file");
                     commit_file(fx.root, "main.txt", "main\n", "Main file");

                     auto outcome = fx.reconciler.rebase_main_into_workspace(fx.workspace, "main");
                     require(outcome.ok(), outcome.error());
                     require(std::filesystem::exists(fx.workspace / "main.txt"),
                             "main's commit should be in the workspace");
                     require(outcome.value().commands.back() == "git rebase main",
                             "the rebase command should be reported");
                     require(outcome.value().divergence.has_value(), "divergence should refresh");
                     require(outcome.value().divergence->ahead == 1, "one workspace commit ahead");
                     require(outcome.value().divergence->behind == 0, "nothing behind after rebase");
                     require(!fx.locks->is_locked(forkyard::sync::workspace_lock_key(fx.workspace.string())),
                             "workspace lock should be released");
                   }});

  tests.push_back({"reconcile_rebase_main_refuses_conflicts", [] {
                     ReconcileFixture fx;
                     commit_file(fx.workspace, "README.md", "workspace version\n", "Workspace edit");
                     commit_file(fx.root, "README.md", "main version\n", "Main edit");
                     const auto head_before = git(fx.workspace, {"rev-parse", "HEAD"});

                     auto outcome = fx.reconciler.rebase_main_into_workspace(fx.workspace, "main");
                     require(!outcome.ok(), "conflicting rebase should fail");
                     require(outcome.kind() == common::ErrorKind::Conflict, "conflict kind expected");
                     require(common::contains(outcome.error(), "README.md"),
                             "message should name the file: " + outcome.error());
                     require(git(fx.workspace, {"rev-parse", "HEAD"}) == head_before,
                             "workspace must be left untouched");
                     require(git(fx.workspace, {"status", "--porcelain"}).empty(),
                             "no rebase should be in progress");
                     const auto &diagnostics = outcome.details().diagnostics;
                     require(diagnostics.has_value(), "refusal carries git diagnostics");
                     require(!diagnostics->commands.empty() &&
                                 common::contains(diagnostics->commands.front(), "merge-base"),
                             "conflict check commands are reported");
                     require(diagnostics->working_directory == fx.workspace.string(),
                             "working directory reported");
                   }});

  tests.push_back({"reconcile_rebase_waits_for_workspace_lock", [] {
                     ws::ReconcileOptions options;
                     options.lock_timeout = std::chrono::milliseconds(100);
                     ReconcileFixture fx(options);
                     auto held = fx.locks->acquire(forkyard::sync::workspace_lock_key(fx.workspace.string()));
                     require(held.ok(), held.error());

                     auto outcome = fx.reconciler.rebase_main_into_workspace(fx.workspace, "main");
                     require(!outcome.ok(), "held lock should block the rebase");
                     require(outcome.kind() == common::ErrorKind::Contention, "contention expected");
                   }});

  tests.push_back({"reconcile_rebase_to_main_nothing_to_do", [] {
                     ReconcileFixture fx;
                     auto outcome = fx.reconciler.rebase_to_main(fx.root, fx.workspace, "main");
                     require(!outcome.ok(), "no commits means nothing to do");
                     require(outcome.kind() == common::ErrorKind::NothingToDo, "nothing-to-do kind");
                     require(common::contains(outcome.error(), "No commits to rebase"),
                             "message mismatch: " + outcome.error());
                   }});

  tests.push_back({"reconcile_rebase_to_main_moves_main", [] {
                     ReconcileFixture fx;
                     commit_file(fx.workspace, "one.txt", "1\n", "First feature commit");
                     const auto tip = commit_file(fx.workspace, "two.txt", "2\n", "Second feature commit");

                     auto outcome = fx.reconciler.rebase_to_main(fx.root, fx.workspace, "main");
                     require(outcome.ok(), outcome.error());
                     require(git(fx.root, {"rev-parse", "main"}) == tip, "main should reach the tip");
                     require(count_commits(fx.root, "main") == "3", "both commits kept");
                     require(std::filesystem::exists(fx.root / "two.txt"), "project root updated");
                     require(outcome.value().divergence.has_value(), "divergence should refresh");
                     require(outcome.value().divergence->ahead == 0 &&
                                 outcome.value().divergence->behind == 0,
                             "workspace and main should match");
                   }});

  tests.push_back({"reconcile_squash_and_rebase_to_main", [] {
                     ReconcileFixture fx;
                     commit_file(fx.workspace, "one.txt", "1\n", "First feature commit");
                     commit_file(fx.workspace, "two.txt", "2\n", "Second feature commit");

                     auto outcome = fx.reconciler.squash_and_rebase_to_main(fx.root, fx.workspace, "main",
                                                                           "Add numbered files");
                     require(outcome.ok(), outcome.error());
                     require(count_commits(fx.root, "main") == "2", "feature should be one commit");
                     require(git(fx.root, {"log", "-1", "--pretty=%s", "main"}) == "Add numbered files",
                             "squash message expected");
                     require(std::filesystem::exists(fx.root / "one.txt") &&
                                 std::filesystem::exists(fx.root / "two.txt"),
                             "squashed files should land on main");
                     require(git(fx.workspace, {"rev-parse", "HEAD"}) == git(fx.root, {"rev-parse", "main"}),
                             "workspace and main should share the squashed commit");
                   }});

  tests.push_back({"reconcile_squash_validates_input", [] {
                     ReconcileFixture fx;
                     auto empty_message =
                         fx.reconciler.squash_and_rebase_to_main(fx.root, fx.workspace, "main", "  ");
                     require(!empty_message.ok(), "empty message should fail");
                     require(empty_message.kind() == common::ErrorKind::Configuration,
                             "empty message is a configuration error");

                     auto nothing =
                         fx.reconciler.squash_and_rebase_to_main(fx.root, fx.workspace, "main", "Squash");
                     require(!nothing.ok(), "no commits means nothing to squash");
                     require(nothing.kind() == common::ErrorKind::NothingToDo, "nothing-to-do kind");
                   }});

  tests.push_back({"reconcile_generated_commands", [] {
                     const auto rebase = ws::Reconciler::generate_rebase_commands("main");
                     require(rebase == std::vector<std::string>{"git rebase main"}, "rebase preview");

                     const auto squash = ws::Reconciler::generate_squash_commands("main", "feature");
                     require(squash.size() == 5, "squash preview has five steps");
                     require(squash.front() == "git merge-base main HEAD", "merge-base first");
                     require(squash.back() == "git rebase feature", "rebase of the feature branch last");
                   }});
}
