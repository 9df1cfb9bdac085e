#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace forkyard::config {

struct StorageConfig {
  /// Empty means <config dir>/forkyard.db.
  std::string database_path;
};

struct WorkspaceConfig {
  /// Subfolder under the project root that holds worktrees, unless a project overrides it.
  std::string folder = "worktrees";
  std::string git_binary = "git";
};

struct QueueConfig {
  std::string backend = "local";
  std::string path;
  /// 0 selects the platform default.
  std::uint32_t session_concurrency = 0;
  std::uint32_t input_concurrency = 10;
  std::uint32_t continue_concurrency = 10;
  std::uint32_t poll_interval_ms = 100;
};

struct PanelsConfig {
  std::uint32_t wait_attempts = 15;
  std::uint32_t wait_interval_ms = 200;
};

struct ReconcileConfig {
  std::uint64_t post_timeout_ms = 30'000;
  std::uint64_t lock_timeout_ms = 30'000;
  std::uint64_t rebase_timeout_ms = 120'000;
  std::uint64_t squash_timeout_ms = 180'000;
};

struct NamingConfig {
  std::string provider = "anthropic";
  std::string model = "claude-3-haiku-20240307";
  std::optional<std::string> api_key;
  std::string base_url = "https://api.anthropic.com";
  std::uint64_t timeout_ms = 10'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  StorageConfig storage;
  WorkspaceConfig workspace;
  QueueConfig queue;
  PanelsConfig panels;
  ReconcileConfig reconcile;
  NamingConfig naming;
  ObservabilityConfig observability;
};

} // namespace forkyard::config
