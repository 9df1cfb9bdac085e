#pragma once

#include "forkyard/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace forkyard::common {

struct ProcessOptions {
  std::filesystem::path working_directory;
  std::chrono::milliseconds timeout{std::chrono::minutes(2)};
  /// Extra variables set in the child on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> environment;
  std::size_t max_output_bytes = 4 * 1024 * 1024;
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool truncated = false;

  [[nodiscard]] bool success() const { return !timed_out && exit_code == 0; }
  /// stdout followed by stderr, for diagnostics.
  [[nodiscard]] std::string combined_output() const;
};

/// Runs argv[0] (looked up on PATH) with stdin closed. Fails only when the process could not
/// be started; a non-zero exit is reported through ProcessResult.
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const ProcessOptions &options = {});

/// Runs `script` through /bin/sh -c.
[[nodiscard]] Result<ProcessResult> run_shell(const std::string &script,
                                              const ProcessOptions &options = {});

} // namespace forkyard::common
