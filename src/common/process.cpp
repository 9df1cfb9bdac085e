#include "forkyard/common/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace forkyard::common {

namespace {

void append_capped(std::string &target, const char *data, const std::size_t size,
                   const std::size_t cap, bool &truncated) {
  const std::size_t remaining = cap > target.size() ? cap - target.size() : 0;
  const std::size_t to_copy = std::min(remaining, size);
  target.append(data, to_copy);
  if (to_copy < size) {
    truncated = true;
  }
}

// Returns false once the descriptor reached EOF.
bool drain(const int fd, std::string &target, const std::size_t cap, bool &truncated) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      append_capped(target, buffer.data(), static_cast<std::size_t>(bytes), cap, truncated);
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
}

// The inherited environment with `overrides` replacing or adding entries.
std::vector<std::string>
merged_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view text(*entry);
    const auto name = text.substr(0, text.find('='));
    const bool replaced = std::any_of(overrides.begin(), overrides.end(),
                                      [&](const auto &item) { return item.first == name; });
    if (!replaced) {
      entries.emplace_back(text);
    }
  }
  for (const auto &[name, value] : overrides) {
    entries.push_back(name + "=" + value);
  }
  return entries;
}

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

std::string ProcessResult::combined_output() const {
  if (stderr_text.empty()) {
    return stdout_text;
  }
  if (stdout_text.empty()) {
    return stderr_text;
  }
  return stdout_text + (stdout_text.back() == '\n' ? "" : "\n") + stderr_text;
}

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const ProcessOptions &options) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure("Empty command line");
  }

  // The child's environment and failure messages are prepared here; after fork() only
  // async-signal-safe calls are made.
  const std::vector<std::string> env_entries = merged_environment(options.environment);
  std::vector<char *> c_envp;
  c_envp.reserve(env_entries.size() + 1);
  for (const auto &entry : env_entries) {
    c_envp.push_back(const_cast<char *>(entry.c_str()));
  }
  c_envp.push_back(nullptr);

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);
  const std::string cwd = options.working_directory.string();
  const std::string chdir_failed = "cannot enter " + cwd + "\n";
  const std::string exec_failed = "exec failed: " + argv[0] + "\n";

  // O_CLOEXEC keeps these pipes out of children forked concurrently by other threads.
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    return Result<ProcessResult>::failure(ErrorKind::External,
                                          std::string("Failed to create pipe: ") +
                                              std::strerror(errno));
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    const int saved = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    return Result<ProcessResult>::failure(ErrorKind::External,
                                          std::string("Failed to create pipe: ") +
                                              std::strerror(saved));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return Result<ProcessResult>::failure(ErrorKind::External, "Failed to fork");
  }

  if (pid == 0) {
    // dup2 clears O_CLOEXEC on the targets, the originals close on exec.
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    const int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      (void)write(STDERR_FILENO, chdir_failed.data(), chdir_failed.size());
      _exit(126);
    }

    execvpe(c_argv[0], c_argv.data(), c_envp.data());
    (void)write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);

  ProcessResult result;
  bool out_open = true;
  bool err_open = true;
  bool exited = false;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (!exited || out_open || err_open) {
    if (std::chrono::steady_clock::now() - started > options.timeout) {
      kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    std::array<pollfd, 2> fds{{
        {.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0},
    }};
    (void)poll(fds.data(), fds.size(), 50);

    if (out_open) {
      out_open = drain(out_pipe[0], result.stdout_text, options.max_output_bytes,
                       result.truncated);
    }
    if (err_open) {
      err_open = drain(err_pipe[0], result.stderr_text, options.max_output_bytes,
                       result.truncated);
    }

    if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
    }
  }

  close(out_pipe[0]);
  close(err_pipe[0]);
  if (!exited) {
    waitpid(pid, &status, 0);
  }

  if (!result.timed_out) {
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  }
  return Result<ProcessResult>::success(std::move(result));
}

Result<ProcessResult> run_shell(const std::string &script, const ProcessOptions &options) {
  return run_process({"/bin/sh", "-c", script}, options);
}

} // namespace forkyard::common
