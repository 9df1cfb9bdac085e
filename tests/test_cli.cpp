#include "test_framework.hpp"

#include "forkyard/cli/commands.hpp"
#include "forkyard/common/fs.hpp"
#include "forkyard/config/config.hpp"
#include "forkyard/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using forkyard::tests::require;
namespace common = forkyard::common;
namespace testing = forkyard::testing;

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

// Fresh HOME with its own database and a silent observer. Restores globals on exit.
struct CliEnvironment {
  testing::TempWorkspace temp;
  EnvGuard home{"HOME", temp.path().string()};
  EnvGuard config_path{"FORKYARD_CONFIG_PATH", std::nullopt};
  EnvGuard database{"FORKYARD_DATABASE_PATH", (temp.path() / "state" / "forkyard.db").string()};
  EnvGuard queue{"FORKYARD_QUEUE_BACKEND", std::nullopt};
  EnvGuard observer{"FORKYARD_OBSERVABILITY", std::string("noop")};
  EnvGuard api_key{"ANTHROPIC_API_KEY", std::nullopt};

  CliEnvironment() { forkyard::config::clear_config_path_override(); }

  ~CliEnvironment() {
    forkyard::config::clear_config_path_override();
    forkyard::observability::set_global_observer(nullptr);
  }
};

struct CliRun {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CliRun run(std::vector<std::string> args) {
  args.insert(args.begin(), "forkyard");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  CliRun result;
  result.exit_code = forkyard::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_cli_tests(std::vector<forkyard::tests::TestCase> &tests) {
  tests.push_back({"cli_help_and_version", [] {
                     CliEnvironment env;
                     const auto help = run({"--help"});
                     require(help.exit_code == 0, "help exits cleanly");
                     require(contains(help.out, "Usage: forkyard"), help.out);
                     require(contains(help.out, "squash <session> -m MESSAGE"), help.out);

                     const auto bare = run({});
                     require(bare.exit_code == 0 && contains(bare.out, "Usage: forkyard"),
                             "no arguments prints help");

                     const auto version = run({"version"});
                     require(version.exit_code == 0, "version exits cleanly");
                     require(version.out.rfind("forkyard ", 0) == 0, version.out);
                   }});

  tests.push_back({"cli_rejects_unknown_commands_and_bad_options", [] {
                     CliEnvironment env;
                     const auto unknown = run({"frobnicate"});
                     require(unknown.exit_code == 1, "unknown command fails");
                     require(contains(unknown.err, "Unknown command: frobnicate"), unknown.err);

                     const auto missing = run({"--config"});
                     require(missing.exit_code == 1, "missing --config value fails");
                     require(contains(missing.err, "missing value for --config"), missing.err);

                     const auto usage = run({"project"});
                     require(usage.exit_code == 1 && contains(usage.err, "Usage: forkyard project"),
                             "project needs an action");
                   }});

  tests.push_back({"cli_config_show_masks_secrets", [] {
                     CliEnvironment env;
                     const auto path = env.temp.path() / "custom.toml";
                     {
                       std::ofstream file(path);
                       file << "[naming]\n"
                            << "api_key = \"sk-very-secret\"\n"
                            << "\n[queue]\n"
                            << "input_concurrency = 4\n";
                     }

                     const auto where = run({"--config", path.string(), "config", "path"});
                     require(where.exit_code == 0, where.err);
                     require(contains(where.out, path.string()), where.out);

                     const auto shown = run({"--config=" + path.string(), "config", "show"});
                     require(shown.exit_code == 0, shown.err);
                     require(contains(shown.out, "input_concurrency = 4"), shown.out);
                     require(contains(shown.out, "api_key = \"***\""), shown.out);
                     require(!contains(shown.out, "sk-very-secret"), "secret stays hidden");
                   }});

  tests.push_back({"cli_project_workspace_and_session_flow", [] {
                     CliEnvironment env;
                     const auto repo = env.temp.path() / "project";
                     testing::init_repository(repo);

                     const auto added = run({"project", "add", repo.string(), "--name", "demo"});
                     require(added.exit_code == 0, added.err);
                     require(contains(added.out, "Added project 1: demo"), added.out);

                     const auto listed = run({"project", "list"});
                     require(listed.exit_code == 0, listed.err);
                     require(contains(listed.out, "* 1  demo"), listed.out);

                     const auto created = run({"workspace", "create", "scratch"});
                     require(created.exit_code == 0, created.err);
                     require(std::filesystem::exists(repo / "worktrees" / "scratch"),
                             "worktree directory exists");
                     require(contains(created.out, "on branch scratch from main"), created.out);

                     const auto branches = run({"workspace", "branches"});
                     require(contains(branches.out, "scratch  (worktree)"), branches.out);

                     const auto removed = run({"workspace", "remove", "scratch"});
                     require(removed.exit_code == 0, removed.err);
                     require(!std::filesystem::exists(repo / "worktrees" / "scratch"),
                             "worktree directory removed");

                     const auto session =
                         run({"session", "create", "-t", "none", "-n", "Manual Task", "by hand"});
                     require(session.exit_code == 0, session.err);
                     require(contains(session.out, "Manual Task  [manual-task]"), session.out);

                     const auto lines = common::split_lines(session.out);
                     require(lines.size() >= 2, session.out);
                     const auto session_id = lines[0].substr(0, lines[0].find(' '));
                     const std::filesystem::path workspace_path = common::trim(lines[1]);
                     {
                       std::ofstream notes(workspace_path / "notes.txt");
                       notes << "manual change\n";
                     }
                     const auto recorded = run({"session", "record", session_id});
                     require(recorded.exit_code == 0, recorded.err);
                     require(contains(recorded.out, "Recorded execution 1: +1 -0 in 1 files"),
                             recorded.out);
                     require(contains(recorded.out, "checkpoint: execution 1"), recorded.out);
                     require(testing::git(workspace_path, {"status", "--porcelain"}).empty(),
                             "manual turn is checkpointed");
                     const auto diffs = run({"session", "diffs", session_id});
                     require(diffs.exit_code == 0, diffs.err);
                     require(contains(diffs.out, "#1  "), diffs.out);
                     require(contains(diffs.out, "    notes.txt"), diffs.out);

                     const auto streamed = run({"session", "create", "--jsonl", "-t", "none", "-n",
                                                "Streamed", "watch me"});
                     require(streamed.exit_code == 0, streamed.err);
                     require(contains(streamed.out, "{\"event\":\"session_created\",\"session\":{"),
                             streamed.out);
                     require(contains(streamed.out, "\"name\":\"Streamed\""), streamed.out);

                     const auto sessions = run({"session", "list"});
                     require(contains(sessions.out, "Manual Task"), sessions.out);
                     require(contains(sessions.out, "Streamed  [streamed]"), sessions.out);

                     const auto bad_squash = run({"squash", "whatever"});
                     require(bad_squash.exit_code == 1, "squash requires a message");
                     require(contains(bad_squash.err, "requires a commit message"), bad_squash.err);
                   }});

  tests.push_back({"cli_workspace_without_project_reports_configuration", [] {
                     CliEnvironment env;
                     const auto result = run({"workspace", "list"});
                     require(result.exit_code == 1, "fails without a project");
                     require(contains(result.err, "No active project"), result.err);
                   }});
}
