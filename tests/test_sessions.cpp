#include "test_framework.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/json_util.hpp"
#include "forkyard/events/notifier.hpp"
#include "forkyard/sessions/execution_tracker.hpp"
#include "forkyard/sessions/manager.hpp"
#include "forkyard/sessions/sqlite_store.hpp"
#include "forkyard/sessions/state_machine.hpp"
#include "forkyard/workspace/diff.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace {

namespace fs = forkyard::sessions;

fs::Session make_session(std::int64_t project_id, const std::string &name,
                         const std::string &workspace_name = "") {
  fs::Session session;
  session.name = name;
  session.workspace_name = workspace_name.empty() ? name : workspace_name;
  session.initial_prompt = "do the thing";
  session.base_branch = "main";
  session.project_id = project_id;
  return session;
}

} // namespace

void register_sessions_tests(std::vector<forkyard::tests::TestCase> &tests) {
  using forkyard::tests::require;
  namespace common = forkyard::common;
  namespace events = forkyard::events;

  tests.push_back({"store_projects_first_is_active", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "state" / "forkyard.db");
                     require(store.status().ok(), store.status().error());

                     auto first = store.create_project({.name = "alpha", .path = "/src/alpha"});
                     require(first.ok(), first.error());
                     require(first.value().active, "first project becomes active");
                     auto second = store.create_project(
                         {.name = "beta", .path = "/src/beta", .worktree_folder = std::string(".trees")});
                     require(second.ok(), second.error());
                     require(!second.value().active, "later projects are inactive");

                     auto duplicate = store.create_project({.name = "again", .path = "/src/alpha"});
                     require(!duplicate.ok(), "duplicate path should fail");
                     require(duplicate.kind() == common::ErrorKind::Configuration,
                             "duplicate path is a configuration error");

                     require(store.set_active_project(second.value().id).ok(), "activate beta");
                     auto active = store.active_project();
                     require(active.ok() && active.value().has_value(), "an active project exists");
                     require(active.value()->name == "beta", "beta should be active");
                     require(active.value()->worktree_folder == std::optional<std::string>(".trees"),
                             "worktree folder round trips");

                     auto listed = store.list_projects();
                     require(listed.ok() && listed.value().size() == 2, "two projects listed");
                     int active_count = 0;
                     for (const auto &project : listed.value()) {
                       active_count += project.active ? 1 : 0;
                     }
                     require(active_count == 1, "exactly one active project");

                     auto missing = store.get_project(999);
                     require(!missing.ok() && missing.kind() == common::ErrorKind::NotFound,
                             "missing project is NotFound");
                     require(store.set_active_project(999).kind() == common::ErrorKind::NotFound,
                             "activating a missing project is NotFound");
                   }});

  tests.push_back({"store_sessions_crud_and_names", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "forkyard.db");
                     auto project = store.create_project({.name = "p", .path = "/src/p"});
                     require(project.ok(), project.error());
                     const auto pid = project.value().id;

                     auto folder = store.create_folder("Batch", pid);
                     require(folder.ok(), folder.error());
                     auto session = make_session(pid, "Fix Auth", "fix-auth");
                     session.folder_id = folder.value().id;
                     session.tool = fs::ToolKind::Codex;
                     session.commit_mode = fs::CommitMode::Structured;
                     session.auto_commit = false;
                     auto created = store.create_session(session);
                     require(created.ok(), created.error());
                     require(!created.value().id.empty(), "id is assigned");
                     require(created.value().created_at == created.value().updated_at,
                             "timestamps start equal");

                     auto loaded = store.get_session(created.value().id);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().folder_id == folder.value().id, "folder round trips");
                     require(loaded.value().tool == fs::ToolKind::Codex, "tool round trips");
                     require(loaded.value().commit_mode == fs::CommitMode::Structured,
                             "commit mode round trips");
                     require(!loaded.value().auto_commit, "auto commit round trips");
                     require(loaded.value().status == fs::PersistedStatus::Pending, "new sessions pend");

                     require(store.display_name_exists(pid, "Fix Auth").value(), "display name taken");
                     require(!store.display_name_exists(pid, "Other").value(), "unknown display name");
                     require(store.workspace_name_exists(pid, "fix-auth").value(), "workspace name taken");
                     require(store.workspace_name_exists(pid, "Fix Auth").value(),
                             "session names also block workspace names");

                     auto updated = store.update_status(created.value().id, fs::PersistedStatus::Running,
                                                        std::string("Agent started"));
                     require(updated.ok(), updated.error());
                     require(updated.value().status_message == "Agent started", "message stored");
                     require(updated.value().updated_at > created.value().updated_at,
                             "updated_at increases");

                     require(store.archive(created.value().id).ok(), "archive");
                     auto visible = store.list_sessions(pid, false);
                     require(visible.ok() && visible.value().empty(), "archived sessions are hidden");
                     auto all = store.list_sessions(pid, true);
                     require(all.ok() && all.value().size() == 1, "archived sessions can be listed");
                     require(store.display_name_exists(pid, "Fix Auth").value(),
                             "archived sessions keep their display name");

                     auto missing = store.get_session("nope");
                     require(!missing.ok() && missing.kind() == common::ErrorKind::NotFound,
                             "unknown session is NotFound");
                     auto missing_update = store.update_status("nope", fs::PersistedStatus::Failed);
                     require(missing_update.kind() == common::ErrorKind::NotFound,
                             "updating an unknown session is NotFound");
                   }});

  tests.push_back({"store_lists_sessions_in_creation_order", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "forkyard.db");
                     auto a = store.create_project({.name = "a", .path = "/a"});
                     auto b = store.create_project({.name = "b", .path = "/b"});
                     require(a.ok() && b.ok(), "projects");
                     for (const std::string name : {"one", "two", "three"}) {
                       require(store.create_session(make_session(a.value().id, name)).ok(), name);
                     }
                     require(store.create_session(make_session(b.value().id, "other")).ok(), "other");

                     auto listed = store.list_sessions(a.value().id, false);
                     require(listed.ok() && listed.value().size() == 3, "three sessions in project a");
                     require(listed.value()[0].name == "one" && listed.value()[2].name == "three",
                             "oldest first");
                     auto everything = store.list_sessions(std::nullopt, false);
                     require(everything.ok() && everything.value().size() == 4, "all projects listed");
                   }});

  tests.push_back({"store_stop_active_sessions", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "forkyard.db");
                     auto project = store.create_project({.name = "p", .path = "/p"});
                     auto pending = store.create_session(make_session(project.value().id, "pending"));
                     auto running = store.create_session(make_session(project.value().id, "running"));
                     auto failed = store.create_session(make_session(project.value().id, "failed"));
                     require(pending.ok() && running.ok() && failed.ok(), "sessions");
                     require(store.update_status(running.value().id, fs::PersistedStatus::Running).ok(), "run");
                     require(store.update_status(failed.value().id, fs::PersistedStatus::Failed).ok(), "fail");

                     auto stopped = store.stop_active_sessions();
                     require(stopped.ok(), stopped.error());
                     require(stopped.value().size() == 2, "pending and running are stopped");
                     require(store.get_session(running.value().id).value().status ==
                                 fs::PersistedStatus::Stopped,
                             "running becomes stopped");
                     require(store.get_session(failed.value().id).value().status ==
                                 fs::PersistedStatus::Failed,
                             "failed is untouched");
                   }});

  tests.push_back({"store_conversation_history_by_panel", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "forkyard.db");
                     auto project = store.create_project({.name = "p", .path = "/p"});
                     auto session = store.create_session(make_session(project.value().id, "chat"));
                     require(session.ok(), session.error());
                     const auto &id = session.value().id;

                     require(store.add_conversation_message(id, std::nullopt, "user", "hello").ok(), "m1");
                     require(store.add_conversation_message(id, std::string("panel-1"), "user", "p1").ok(),
                             "m2");
                     require(store.add_conversation_message(id, std::string("panel-1"), "assistant", "ok")
                                 .ok(),
                             "m3");
                     require(store.add_conversation_message(id, std::string("panel-2"), "user", "p2").ok(),
                             "m4");

                     auto all = store.conversation_history(id, std::nullopt);
                     require(all.ok() && all.value().size() == 4, "whole session history");
                     require(all.value().front().content == "hello", "oldest first");
                     auto panel = store.conversation_history(id, std::string("panel-1"));
                     require(panel.ok() && panel.value().size() == 2, "panel-1 history only");
                     require(panel.value()[1].role == "assistant", "roles round trip");
                     require(panel.value()[0].panel_id == std::optional<std::string>("panel-1"),
                             "panel id round trips");
                   }});

  tests.push_back({"store_execution_diffs_sequence", [] {
                     forkyard::testing::TempWorkspace temp;
                     fs::SqliteSessionStore store(temp.path() / "forkyard.db");
                     auto project = store.create_project({.name = "p", .path = "/p"});
                     auto session = store.create_session(make_session(project.value().id, "diffs"));
                     const auto &id = session.value().id;

                     require(store.next_execution_sequence(id).value() == 1, "sequences start at 1");
                     fs::ExecutionDiff diff;
                     diff.session_id = id;
                     diff.sequence = 1;
                     diff.files_changed = {"a.txt", "dir/b.txt"};
                     diff.additions = 4;
                     auto added = store.add_execution_diff(diff);
                     require(added.ok(), added.error());
                     require(store.next_execution_sequence(id).value() == 2, "next sequence is 2");

                     auto duplicate = store.add_execution_diff(diff);
                     require(!duplicate.ok(), "duplicate sequence rejected");
                     require(duplicate.kind() == common::ErrorKind::Contention,
                             "duplicate sequence is contention");

                     auto listed = store.list_execution_diffs(id);
                     require(listed.ok() && listed.value().size() == 1, "one diff stored");
                     require(listed.value()[0].files_changed == diff.files_changed,
                             "file list round trips");
                     require(listed.value()[0].additions == 4, "stats round trip");
                   }});

  tests.push_back({"state_machine_visible_status_mapping", [] {
                     const std::string t1 = "2024-01-01T00:00:00.000Z";
                     const std::string t2 = "2024-01-01T00:00:01.000Z";
                     require(fs::visible_status(fs::PersistedStatus::Pending, std::nullopt, t1) ==
                                 fs::VisibleStatus::Initializing,
                             "pending is initializing");
                     require(fs::visible_status(fs::PersistedStatus::Running, std::nullopt, t1) ==
                                 fs::VisibleStatus::Running,
                             "running is running");
                     require(fs::visible_status(fs::PersistedStatus::Failed, t2, t1) ==
                                 fs::VisibleStatus::Error,
                             "failed is error even when viewed");
                     require(fs::visible_status(fs::PersistedStatus::Stopped, std::nullopt, t1) ==
                                 fs::VisibleStatus::CompletedUnviewed,
                             "never viewed is unviewed");
                     require(fs::visible_status(fs::PersistedStatus::Completed, t1, t2) ==
                                 fs::VisibleStatus::CompletedUnviewed,
                             "viewed before the update is unviewed");
                     require(fs::visible_status(fs::PersistedStatus::Stopped, t2, t2) ==
                                 fs::VisibleStatus::Stopped,
                             "viewed at the update is stopped");

                     require(fs::persisted_status(fs::VisibleStatus::CompletedUnviewed) ==
                                 fs::PersistedStatus::Stopped,
                             "unviewed persists as stopped");
                     require(fs::persisted_status(fs::VisibleStatus::Error) == fs::PersistedStatus::Failed,
                             "error persists as failed");
                     require(fs::persisted_status(fs::VisibleStatus::Initializing) ==
                                 fs::PersistedStatus::Pending,
                             "initializing persists as pending");
                     require(fs::is_active(fs::PersistedStatus::Pending) &&
                                 !fs::is_active(fs::PersistedStatus::Stopped),
                             "activity mapping");
                     require(fs::parse_visible_status("completed_unviewed") ==
                                 fs::VisibleStatus::CompletedUnviewed,
                             "visible status parses");
                     require(!fs::parse_tool_kind("emacs").has_value(), "unknown tools are rejected");
                   }});

  tests.push_back({"session_manager_status_and_viewed", [] {
                     forkyard::testing::ServiceHarness harness;
                     auto created = harness.store->create_session(make_session(harness.project.id, "viewed"));
                     require(created.ok(), created.error());
                     const auto &id = created.value().id;

                     auto running = harness.sessions->set_status(id, fs::VisibleStatus::Running);
                     require(running.ok(), running.error());
                     auto stopped = harness.sessions->set_status(id, fs::VisibleStatus::Stopped,
                                                                 std::string("Done"));
                     require(stopped.ok(), stopped.error());
                     require(fs::visible_status(stopped.value()) == fs::VisibleStatus::CompletedUnviewed,
                             "a stopped session is unviewed until viewed");

                     auto viewed = harness.sessions->mark_viewed(id);
                     require(viewed.ok(), viewed.error());
                     require(fs::visible_status(viewed.value()) == fs::VisibleStatus::Stopped,
                             "viewing settles the status");

                     auto message = harness.sessions->set_status_message(id, "Idle");
                     require(message.ok(), message.error());
                     require(fs::visible_status(message.value()) == fs::VisibleStatus::CompletedUnviewed,
                             "a later update needs another view");
                     require(harness.sink->count("session_updated") == 4, "every mutation notifies");
                   }});

  tests.push_back({"session_manager_initialize_stops_stale_sessions", [] {
                     forkyard::testing::ServiceHarness harness;
                     auto stale = harness.store->create_session(make_session(harness.project.id, "stale"));
                     require(stale.ok(), stale.error());
                     require(harness.store->update_status(stale.value().id, fs::PersistedStatus::Running)
                                 .ok(),
                             "run");

                     auto stopped = harness.sessions->initialize();
                     require(stopped.ok(), stopped.error());
                     require(stopped.value() == std::vector<std::string>{stale.value().id},
                             "the running session is stopped");
                     require(harness.sink->count("session_updated") == 1, "update is notified");
                   }});

  tests.push_back({"session_manager_archive_removes_workspace", [] {
                     forkyard::testing::ServiceHarness harness;
                     auto workspace = harness.workspaces->create(harness.project_root, "to-archive");
                     require(workspace.ok(), workspace.error());
                     auto session = make_session(harness.project.id, "To Archive", "to-archive");
                     session.workspace_path = workspace.value().path.string();
                     auto created = harness.store->create_session(session);
                     require(created.ok(), created.error());

                     auto archived = harness.sessions->archive(created.value().id);
                     require(archived.ok(), archived.error());
                     require(!std::filesystem::exists(workspace.value().path), "workspace removed");
                     require(harness.sink->count("session_deleted") == 1, "deletion notified");
                     require(harness.sessions->list(harness.project.id).value().empty(),
                             "archived session hidden");
                     require(harness.sessions->get(created.value().id).value().archived,
                             "row kept as archived");

                     require(harness.sessions->archive(created.value().id).ok(),
                             "archiving twice is a no-op");
                     require(harness.sink->count("session_deleted") == 1, "no second notification");
                     require(harness.sessions->archive("missing").kind() == common::ErrorKind::NotFound,
                             "unknown session is NotFound");
                   }});

  tests.push_back({"execution_tracker_working_tree_then_commits", [] {
                     forkyard::testing::ServiceHarness harness;
                     auto workspace = harness.workspaces->create(harness.project_root, "tracked");
                     require(workspace.ok(), workspace.error());
                     auto session = make_session(harness.project.id, "tracked");
                     session.workspace_path = workspace.value().path.string();
                     auto created = harness.store->create_session(session);
                     require(created.ok(), created.error());
                     const auto &id = created.value().id;
                     const auto path = workspace.value().path;

                     fs::ExecutionTracker tracker(harness.store,
                                                  std::make_shared<forkyard::workspace::DiffCapture>(
                                                      harness.git_runner),
                                                  harness.locks);

                     require(tracker.start(id, path).ok(), "start first turn");
                     require(tracker.is_tracking(id), "turn is tracked");
                     {
                       std::ofstream out(path / "README.md", std::ios::app);
                       out << "edited\n";
                     }
                     auto first = tracker.finish(id);
                     require(first.ok(), first.error());
                     require(first.value().sequence == 1, "first turn is sequence 1");
                     require(first.value().files_changed == std::vector<std::string>{"README.md"},
                             "working tree edit captured");
                     require(first.value().before_commit == first.value().after_commit,
                             "no commit during the first turn");
                     require(!tracker.is_tracking(id), "finish ends the turn");

                     require(tracker.start(id, path).ok(), "start second turn");
                     forkyard::testing::git(path, {"commit", "-q", "-am", "Checkpoint"});
                     forkyard::testing::commit_file(path, "added.txt", "x\n", "Add file");
                     auto second = tracker.finish(id);
                     require(second.ok(), second.error());
                     require(second.value().sequence == 2, "second turn is sequence 2");
                     require(second.value().files_changed_count == 2, "both commits diffed");
                     require(second.value().before_commit != second.value().after_commit,
                             "commits moved HEAD");

                     auto stored = harness.store->list_execution_diffs(id);
                     require(stored.ok() && stored.value().size() == 2, "both turns stored");

                     auto orphan = tracker.finish(id);
                     require(!orphan.ok() && orphan.kind() == common::ErrorKind::NotFound,
                             "finish without start is NotFound");
                   }});

  tests.push_back({"notifier_jsonl_lines", [] {
                     std::ostringstream out;
                     events::JsonlNotificationSink sink(out);
                     fs::Session session;
                     session.id = "s-1";
                     session.name = "Quote \"me\"";
                     session.status = fs::PersistedStatus::Failed;
                     session.updated_at = "2024-01-01T00:00:00.000Z";
                     sink.session_created(session);
                     sink.session_deleted("s-1");
                     sink.folder_created(fs::Folder{.id = "f-1", .name = "Batch", .project_id = 3,
                                                    .created_at = "t"});

                     const auto lines = common::split_lines(out.str());
                     require(lines.size() == 3, "one line per event");
                     require(common::starts_with(lines[0], "{\"event\":\"session_created\""),
                             "event name first: " + lines[0]);
                     require(common::contains(lines[0], "\"status\":\"error\""),
                             "visible status is published");
                     require(common::contains(lines[0], "\"name\":\"Quote \\\"me\\\"\""),
                             "strings are escaped");
                     require(common::contains(lines[0], "\"folder_id\":null"), "missing folder is null");
                     require(lines[1] == "{\"event\":\"session_deleted\",\"session_id\":\"s-1\"}",
                             "deletion line: " + lines[1]);
                     require(common::contains(lines[2], "\"project_id\":3"), "folder line");
                   }});

  tests.push_back({"notifier_fanout_reaches_every_sink", [] {
                     auto first = std::make_shared<forkyard::testing::RecordingSink>();
                     auto second = std::make_shared<forkyard::testing::RecordingSink>();
                     events::FanoutNotificationSink fanout;
                     fanout.add(first);
                     fanout.add(second);
                     fanout.add(nullptr);
                     fs::Session session;
                     session.id = "s";
                     fanout.session_updated(session);
                     require(first->count("session_updated") == 1 && second->count("session_updated") == 1,
                             "both sinks notified");
                   }});
}
