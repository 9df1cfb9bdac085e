#include "forkyard/workspace/git.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/process.hpp"
#include "forkyard/observability/global.hpp"

namespace forkyard::workspace {

namespace {

std::string shell_quote(const std::string &arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`") == std::string::npos) {
    return arg;
  }
  std::string quoted = "'";
  for (const char ch : arg) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace

std::string GitOutput::text() const { return common::trim(stdout_text); }

std::string GitOutput::combined() const {
  if (stderr_text.empty()) {
    return stdout_text;
  }
  if (stdout_text.empty()) {
    return stderr_text;
  }
  return stdout_text + (stdout_text.back() == '\n' ? "" : "\n") + stderr_text;
}

void GitTranscript::record(const std::string &command_line, const std::filesystem::path &cwd,
                           const std::string &output) {
  commands_.push_back(command_line);
  output_ += "$ " + command_line + "  (in " + cwd.string() + ")\n";
  if (!output.empty()) {
    output_ += output;
    if (output.back() != '\n') {
      output_.push_back('\n');
    }
  }
}

common::GitDiagnostics
GitTranscript::diagnostics(const std::filesystem::path &working_directory,
                           const std::filesystem::path &project_path) const {
  return common::GitDiagnostics{.commands = commands_,
                                .output = output_,
                                .working_directory = working_directory.string(),
                                .project_path = project_path.string()};
}

GitRunner::GitRunner(std::string git_binary, const std::chrono::milliseconds default_timeout,
                     const std::size_t max_output_bytes)
    : git_binary_(std::move(git_binary)), default_timeout_(default_timeout),
      max_output_bytes_(max_output_bytes) {}

std::string GitRunner::command_line(const std::vector<std::string> &args) const {
  std::string line = git_binary_;
  for (const auto &arg : args) {
    line += " " + shell_quote(arg);
  }
  return line;
}

common::Result<GitOutput> GitRunner::probe(const std::filesystem::path &cwd,
                                           const std::vector<std::string> &args,
                                           GitTranscript *transcript,
                                           const std::optional<std::chrono::milliseconds> timeout) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_binary_);
  argv.insert(argv.end(), args.begin(), args.end());

  common::ProcessOptions options;
  options.working_directory = cwd;
  options.timeout = timeout.value_or(default_timeout_);
  options.max_output_bytes = max_output_bytes_;
  options.environment = {{"GIT_TERMINAL_PROMPT", "0"},
                         {"GIT_EDITOR", "true"},
                         {"GIT_SEQUENCE_EDITOR", "true"},
                         {"LC_ALL", "C"}};

  const auto started = std::chrono::steady_clock::now();
  auto process = common::run_process(argv, options);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  const std::string line = command_line(args);

  if (!process.ok()) {
    if (transcript != nullptr) {
      transcript->record(line, cwd, process.error());
    }
    return common::Result<GitOutput>::failure(common::ErrorKind::External,
                                              "Failed to start " + line + ": " + process.error());
  }

  const auto &result = process.value();
  observability::record_metric(observability::GitCommandLatencyMetric{
      .subcommand = args.empty() ? std::string() : args.front(),
      .latency = elapsed,
      .exit_code = result.exit_code});

  GitOutput output{.exit_code = result.exit_code,
                   .stdout_text = result.stdout_text,
                   .stderr_text = result.stderr_text,
                   .truncated = result.truncated};
  if (transcript != nullptr) {
    transcript->record(line, cwd, output.combined());
  }

  if (result.timed_out) {
    return common::Result<GitOutput>::failure(
        common::ErrorKind::External,
        line + " timed out after " + std::to_string(options.timeout.count()) + "ms");
  }
  return common::Result<GitOutput>::success(std::move(output));
}

common::Result<GitOutput> GitRunner::run(const std::filesystem::path &cwd,
                                         const std::vector<std::string> &args,
                                         GitTranscript *transcript,
                                         const std::optional<std::chrono::milliseconds> timeout) const {
  auto output = probe(cwd, args, transcript, timeout);
  if (!output.ok()) {
    return output;
  }
  if (!output.value().ok()) {
    std::string detail = common::trim(output.value().stderr_text);
    if (detail.empty()) {
      detail = common::trim(output.value().stdout_text);
    }
    return common::Result<GitOutput>::failure(
        common::ErrorKind::External,
        command_line(args) + " failed (exit " + std::to_string(output.value().exit_code) + ")" +
            (detail.empty() ? "" : ": " + detail));
  }
  return output;
}

} // namespace forkyard::workspace
