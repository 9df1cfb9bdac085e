#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forkyard::common {

enum class ErrorKind {
  Configuration,
  Contention,
  External,
  NothingToDo,
  Conflict,
  NotFound,
  Internal,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Contention:
    return "contention";
  case ErrorKind::External:
    return "external";
  case ErrorKind::NothingToDo:
    return "nothing_to_do";
  case ErrorKind::Conflict:
    return "conflict";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

/// Everything needed to replay a failed git operation by hand.
struct GitDiagnostics {
  std::vector<std::string> commands;
  std::string output;
  std::string working_directory;
  std::string project_path;
};

struct Error {
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
  std::optional<GitDiagnostics> diagnostics;

  [[nodiscard]] std::string describe() const {
    std::string out = message;
    if (diagnostics.has_value()) {
      for (const auto &command : diagnostics->commands) {
        out += "\n  $ " + command;
      }
      if (!diagnostics->output.empty()) {
        out += "\n" + diagnostics->output;
      }
    }
    return out;
  }
};

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(std::string message) {
    return Status(Error{.kind = ErrorKind::Internal, .message = std::move(message)});
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(Error{.kind = kind, .message = std::move(message)});
  }
  static Status error(Error error) { return Status(std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }
  [[nodiscard]] const std::string &error() const {
    static const std::string empty;
    return error_.has_value() ? error_->message : empty;
  }
  [[nodiscard]] ErrorKind kind() const {
    return error_.has_value() ? error_->kind : ErrorKind::Internal;
  }
  [[nodiscard]] const Error &details() const {
    if (!error_.has_value()) {
      throw std::logic_error("Status has no error");
    }
    return *error_;
  }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(std::string message) {
    return Result(std::nullopt, Error{.kind = ErrorKind::Internal, .message = std::move(message)});
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(std::nullopt, Error{.kind = kind, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (error_.has_value()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (error_.has_value()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const {
    static const std::string empty;
    return error_.has_value() ? error_->message : empty;
  }
  [[nodiscard]] ErrorKind kind() const {
    return error_.has_value() ? error_->kind : ErrorKind::Internal;
  }
  [[nodiscard]] const Error &details() const {
    if (!error_.has_value()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<Error> error_;
};

} // namespace forkyard::common
