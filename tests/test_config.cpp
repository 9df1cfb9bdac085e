#include "test_framework.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace {

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

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = forkyard::config::config_path_override();
    if (next.has_value()) {
      forkyard::config::set_config_path_override(*next);
    } else {
      forkyard::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      forkyard::config::set_config_path_override(*old_override);
    } else {
      forkyard::config::clear_config_path_override();
    }
  }
};

// Isolates a test from the developer's own config: fresh HOME, no path or key overrides.
struct IsolatedHome {
  std::filesystem::path path;
  EnvGuard home;
  EnvGuard config_path{"FORKYARD_CONFIG_PATH", std::nullopt};
  EnvGuard database{"FORKYARD_DATABASE_PATH", std::nullopt};
  EnvGuard queue{"FORKYARD_QUEUE_BACKEND", std::nullopt};
  EnvGuard observer{"FORKYARD_OBSERVABILITY", std::nullopt};
  EnvGuard api_key{"ANTHROPIC_API_KEY", std::nullopt};
  ConfigOverrideGuard no_override;

  explicit IsolatedHome(std::filesystem::path dir)
      : path(std::move(dir)), home("HOME", path.string()) {}
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("forkyard-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<forkyard::tests::TestCase> &tests) {
  using forkyard::tests::require;
  namespace cfg = forkyard::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value() == home.path / ".forkyard", "config dir should be ~/.forkyard");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const IsolatedHome home(make_temp_home());

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.queue.backend == "local", "default queue backend should be local");
                     require(config.queue.session_concurrency == 0,
                             "session concurrency should default to the platform value");
                     require(config.queue.input_concurrency == 10, "input pool width should be 10");
                     require(config.queue.continue_concurrency == 10,
                             "continue pool width should be 10");
                     require(config.panels.wait_attempts == 15, "panel wait attempts should be 15");
                     require(config.panels.wait_interval_ms == 200, "panel wait interval should be 200");
                     require(config.workspace.folder == "worktrees", "worktree folder default");
                     require(config.naming.model == "claude-3-haiku-20240307", "naming model default");
                     require(!config.naming.api_key.has_value(), "api key should be unset");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());

                     write_file(path.value(),
                                R"(
# forkyard settings
[storage]
database_path = "/tmp/forkyard-state.db"

[workspace]
folder = ".trees"

[queue]
backend = "SQLite"
path = "/tmp/forkyard-jobs.db"
session_concurrency = 3
input_concurrency = 4

[panels]
wait_attempts = 5

[reconcile]
squash_timeout_ms = 60000

[naming]
provider = "anthropic"
api_key = "key123"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.storage.database_path == "/tmp/forkyard-state.db",
                             "database path mismatch");
                     require(config.workspace.folder == ".trees", "worktree folder mismatch");
                     require(config.queue.backend == "sqlite", "queue backend should be lowercased");
                     require(config.queue.path == "/tmp/forkyard-jobs.db", "queue path mismatch");
                     require(config.queue.session_concurrency == 3, "session concurrency mismatch");
                     require(config.queue.input_concurrency == 4, "input concurrency mismatch");
                     require(config.queue.continue_concurrency == 10, "continue default should remain");
                     require(config.panels.wait_attempts == 5, "wait attempts mismatch");
                     require(config.panels.wait_interval_ms == 200, "wait interval default should remain");
                     require(config.reconcile.squash_timeout_ms == 60000, "squash timeout mismatch");
                     require(config.naming.api_key.has_value() && *config.naming.api_key == "key123",
                             "api key mismatch");
                   }});

  tests.push_back({"load_config_rejects_malformed_toml", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), "[queue\nbackend = \"local\"\n");

                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.kind() == forkyard::common::ErrorKind::Configuration,
                             "malformed config is a configuration error");
                     require(forkyard::common::contains(loaded.error(), "line 1"),
                             "error should name the line");
                   }});

  tests.push_back({"env_override_precedence", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), "[queue]\nbackend = \"local\"\n");

                     const EnvGuard backend{"FORKYARD_QUEUE_BACKEND",
                                            std::optional<std::string>("sqlite")};
                     const EnvGuard key{"ANTHROPIC_API_KEY", std::optional<std::string>("from-env")};
                     const EnvGuard db{"FORKYARD_DATABASE_PATH",
                                       std::optional<std::string>("/tmp/env.db")};

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().queue.backend == "sqlite", "queue backend env override failed");
                     require(loaded.value().naming.api_key.has_value() &&
                                 *loaded.value().naming.api_key == "from-env",
                             "api key env override failed");
                     require(loaded.value().storage.database_path == "/tmp/env.db",
                             "database env override failed");
                   }});

  tests.push_back({"load_config_reads_dotenv_without_overriding_environment", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     write_file(dir.value() / ".env",
                                "# secrets\nexport ANTHROPIC_API_KEY='dotenv-key'\n"
                                "FORKYARD_OBSERVABILITY=\"none\"\n");
                     const EnvGuard observer{"FORKYARD_OBSERVABILITY",
                                             std::optional<std::string>("log")};

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().naming.api_key.has_value() &&
                                 *loaded.value().naming.api_key == "dotenv-key",
                             ".env should supply the api key");
                     require(loaded.value().observability.backend == "log",
                             "existing environment should win over .env");
                   }});

  tests.push_back({"config_path_override_file_and_directory", [] {
                     const IsolatedHome home(make_temp_home());
                     const auto custom = home.path / "custom" / "forkyard.toml";
                     write_file(custom, "[workspace]\nfolder = \"from-override\"\n");

                     {
                       const ConfigOverrideGuard file_override(custom);
                       auto path = cfg::config_path();
                       require(path.ok(), path.error());
                       require(path.value() == custom, "file override should be used as is");
                       auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().workspace.folder == "from-override",
                               "override file should be loaded");
                     }
                     {
                       const ConfigOverrideGuard dir_override(home.path / "custom");
                       auto path = cfg::config_path();
                       require(path.ok(), path.error());
                       require(path.value() == home.path / "custom" / "config.toml",
                               "directory override should hold config.toml");
                     }
                   }});

  tests.push_back({"database_path_defaults_to_config_dir", [] {
                     const IsolatedHome home(make_temp_home());
                     cfg::Config config;
                     auto path = cfg::database_path(config);
                     require(path.ok(), path.error());
                     require(path.value() == home.path / ".forkyard" / "forkyard.db",
                             "default database should live in the config dir");

                     config.storage.database_path = "~/state/db.sqlite";
                     path = cfg::database_path(config);
                     require(path.ok(), path.error());
                     require(path.value() == home.path / "state" / "db.sqlite",
                             "configured database path should expand ~");
                   }});

  tests.push_back({"validate_config_rejects_invalid_values", [] {
                     cfg::Config config;
                     config.naming.provider = "fallback";
                     require(cfg::validate_config(config).ok(), "defaults should validate");

                     auto bad_backend = config;
                     bad_backend.queue.backend = "redis";
                     auto result = cfg::validate_config(bad_backend);
                     require(!result.ok(), "unknown queue backend should be rejected");
                     require(result.kind() == forkyard::common::ErrorKind::Configuration,
                             "invalid backend is a configuration error");

                     auto missing_path = config;
                     missing_path.queue.backend = "sqlite";
                     require(!cfg::validate_config(missing_path).ok(),
                             "sqlite queue without a path should be rejected");

                     auto zero_width = config;
                     zero_width.queue.input_concurrency = 0;
                     require(!cfg::validate_config(zero_width).ok(), "zero pool width should be rejected");

                     auto bad_provider = config;
                     bad_provider.naming.provider = "openai";
                     require(!cfg::validate_config(bad_provider).ok(),
                             "unknown naming provider should be rejected");
                   }});

  tests.push_back({"validate_config_warns_without_api_key", [] {
                     cfg::Config config;
                     config.observability.level = "verbose";
                     auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "expected api key and level warnings");
                     require(forkyard::common::contains(result.value()[0], "naming.api_key"),
                             "first warning should mention the api key");
                   }});

  tests.push_back({"render_config_masks_secrets", [] {
                     cfg::Config config;
                     config.naming.api_key = "sk-secret";
                     const auto masked = cfg::render_config(config, false);
                     require(!forkyard::common::contains(masked, "sk-secret"), "secret should be masked");
                     require(forkyard::common::contains(masked, "api_key = \"***\""),
                             "masked key should be rendered");
                     const auto full = cfg::render_config(config, true);
                     require(forkyard::common::contains(full, "sk-secret"), "secret should be included");
                   }});

  tests.push_back({"save_config_writes_loadable_file", [] {
                     const IsolatedHome home(make_temp_home());
                     cfg::Config config;
                     config.queue.session_concurrency = 2;
                     config.naming.api_key = "persisted-key";
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config file should exist after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().queue.session_concurrency == 2,
                             "saved concurrency should load back");
                     require(loaded.value().naming.api_key.value_or("") == "persisted-key",
                             "saved key should load back");
                   }});
}
