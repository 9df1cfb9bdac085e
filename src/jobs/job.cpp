#include "forkyard/jobs/job.hpp"

#include "forkyard/common/json_util.hpp"

#include <charconv>
#include <type_traits>

namespace forkyard::jobs {

namespace {

std::optional<std::string> optional_field(const common::JsonFlatMap &fields,
                                          const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string field(const common::JsonFlatMap &fields, const std::string &key) {
  return optional_field(fields, key).value_or("");
}

template <typename Int> std::optional<Int> parse_integer(const std::optional<std::string> &text) {
  if (!text.has_value()) {
    return std::nullopt;
  }
  Int value{};
  const auto *begin = text->data();
  const auto *end = begin + text->size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string_view to_string(const JobKind kind) {
  switch (kind) {
  case JobKind::CreateSession:
    return "create_session";
  case JobKind::SendInput:
    return "send_input";
  case JobKind::ContinueSession:
    return "continue_session";
  }
  return "create_session";
}

std::optional<JobKind> parse_job_kind(const std::string_view text) {
  if (text == "create_session") {
    return JobKind::CreateSession;
  }
  if (text == "send_input") {
    return JobKind::SendInput;
  }
  if (text == "continue_session") {
    return JobKind::ContinueSession;
  }
  return std::nullopt;
}

std::string_view to_string(const JobState state) {
  switch (state) {
  case JobState::Waiting:
    return "waiting";
  case JobState::Active:
    return "active";
  case JobState::Completed:
    return "completed";
  case JobState::Failed:
    return "failed";
  }
  return "failed";
}

JobKind job_kind(const Job &job) {
  return std::visit(
      [](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, CreateSessionJob>) {
          return JobKind::CreateSession;
        } else if constexpr (std::is_same_v<T, SendInputJob>) {
          return JobKind::SendInput;
        } else {
          return JobKind::ContinueSession;
        }
      },
      job);
}

std::string job_to_json(const Job &job) {
  common::JsonObjectWriter writer;
  std::visit(
      [&](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, CreateSessionJob>) {
          writer.add("prompt", value.prompt).add("name_template", value.name_template);
          if (value.index.has_value()) {
            writer.add("index", static_cast<std::int64_t>(*value.index));
          }
          if (value.project_id.has_value()) {
            writer.add("project_id", *value.project_id);
          }
          if (value.base_branch.has_value()) {
            writer.add("base_branch", *value.base_branch);
          }
          writer.add("auto_commit", value.auto_commit)
              .add("tool", std::string(sessions::to_string(value.tool)))
              .add("commit_mode", std::string(sessions::to_string(value.commit_mode)));
          if (value.folder_id.has_value()) {
            writer.add("folder_id", *value.folder_id);
          }
        } else if constexpr (std::is_same_v<T, SendInputJob>) {
          writer.add("session_id", value.session_id).add("input", value.input);
        } else {
          writer.add("session_id", value.session_id).add("prompt", value.prompt);
        }
      },
      job);
  return writer.str();
}

common::Result<Job> job_from_json(const JobKind kind, const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  switch (kind) {
  case JobKind::CreateSession: {
    CreateSessionJob create;
    create.prompt = field(fields, "prompt");
    create.name_template = field(fields, "name_template");
    create.index = parse_integer<std::uint32_t>(optional_field(fields, "index"));
    create.project_id = parse_integer<std::int64_t>(optional_field(fields, "project_id"));
    create.base_branch = optional_field(fields, "base_branch");
    create.auto_commit = field(fields, "auto_commit") != "false";
    const auto tool = sessions::parse_tool_kind(field(fields, "tool"));
    const auto mode = sessions::parse_commit_mode(field(fields, "commit_mode"));
    if (!tool.has_value() || !mode.has_value()) {
      return common::Result<Job>::failure(common::ErrorKind::Internal,
                                          "Malformed create_session payload: " + json);
    }
    create.tool = *tool;
    create.commit_mode = *mode;
    create.folder_id = optional_field(fields, "folder_id");
    return common::Result<Job>::success(Job{std::move(create)});
  }
  case JobKind::SendInput:
    return common::Result<Job>::success(
        Job{SendInputJob{.session_id = field(fields, "session_id"),
                         .input = field(fields, "input")}});
  case JobKind::ContinueSession:
    return common::Result<Job>::success(
        Job{ContinueSessionJob{.session_id = field(fields, "session_id"),
                               .prompt = field(fields, "prompt")}});
  }
  return common::Result<Job>::failure("Unknown job kind");
}

void JobCompletion::complete(JobOutcome outcome) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome_.has_value()) {
      return;
    }
    outcome_ = std::move(outcome);
  }
  cv_.notify_all();
}

JobOutcome JobCompletion::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [&] { return outcome_.has_value(); });
  return *outcome_;
}

bool JobCompletion::done() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcome_.has_value();
}

JobHandle::JobHandle(std::string id, const JobKind kind,
                     std::shared_ptr<JobCompletion> completion)
    : id_(std::move(id)), kind_(kind), completion_(std::move(completion)) {}

JobOutcome JobHandle::wait() const { return completion_->wait(); }

bool JobHandle::done() const { return completion_->done(); }

} // namespace forkyard::jobs
