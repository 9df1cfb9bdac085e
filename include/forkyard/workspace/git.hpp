#pragma once

#include "forkyard/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::workspace {

struct GitOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  /// Output went past the runner's byte cap and was cut.
  bool truncated = false;

  [[nodiscard]] bool ok() const { return exit_code == 0; }
  /// stdout with surrounding whitespace removed.
  [[nodiscard]] std::string text() const;
  [[nodiscard]] std::string combined() const;
};

/// Ordered log of the git commands run for one operation, kept for error reports.
class GitTranscript {
public:
  void record(const std::string &command_line, const std::filesystem::path &cwd,
              const std::string &output);

  [[nodiscard]] const std::vector<std::string> &commands() const { return commands_; }
  [[nodiscard]] const std::string &output() const { return output_; }
  [[nodiscard]] common::GitDiagnostics diagnostics(const std::filesystem::path &working_directory,
                                                   const std::filesystem::path &project_path) const;

private:
  std::vector<std::string> commands_;
  std::string output_;
};

class GitRunner {
public:
  explicit GitRunner(std::string git_binary = "git",
                     std::chrono::milliseconds default_timeout = std::chrono::minutes(2),
                     std::size_t max_output_bytes = 4 * 1024 * 1024);

  /// Non-zero exit becomes an ErrorKind::External failure carrying stderr.
  [[nodiscard]] common::Result<GitOutput>
  run(const std::filesystem::path &cwd, const std::vector<std::string> &args,
      GitTranscript *transcript = nullptr,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  /// Like run(), but a non-zero exit is returned as a GitOutput for the caller to inspect.
  [[nodiscard]] common::Result<GitOutput>
  probe(const std::filesystem::path &cwd, const std::vector<std::string> &args,
        GitTranscript *transcript = nullptr,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  [[nodiscard]] std::string command_line(const std::vector<std::string> &args) const;
  [[nodiscard]] const std::string &binary() const { return git_binary_; }

private:
  std::string git_binary_;
  std::chrono::milliseconds default_timeout_;
  std::size_t max_output_bytes_;
};

} // namespace forkyard::workspace
