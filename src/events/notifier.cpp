#include "forkyard/events/notifier.hpp"

#include "forkyard/common/json_util.hpp"
#include "forkyard/observability/global.hpp"
#include "forkyard/sessions/state_machine.hpp"

namespace forkyard::events {

namespace {

std::string visible(const sessions::Session &session) {
  return std::string(sessions::to_string(sessions::visible_status(session)));
}

} // namespace

std::string session_to_json(const sessions::Session &session) {
  common::JsonObjectWriter writer;
  writer.add("id", session.id)
      .add("name", session.name)
      .add("workspace_name", session.workspace_name)
      .add("workspace_path", session.workspace_path)
      .add("initial_prompt", session.initial_prompt)
      .add("base_branch", session.base_branch)
      .add("base_commit", session.base_commit)
      .add("status", visible(session))
      .add("project_id", session.project_id);
  if (session.folder_id.has_value()) {
    writer.add("folder_id", *session.folder_id);
  } else {
    writer.add_null("folder_id");
  }
  writer.add("tool", std::string(sessions::to_string(session.tool)))
      .add("commit_mode", std::string(sessions::to_string(session.commit_mode)))
      .add("auto_commit", session.auto_commit)
      .add("archived", session.archived);
  if (session.last_viewed_at.has_value()) {
    writer.add("last_viewed_at", *session.last_viewed_at);
  } else {
    writer.add_null("last_viewed_at");
  }
  writer.add("created_at", session.created_at)
      .add("updated_at", session.updated_at)
      .add("status_message", session.status_message);
  return writer.str();
}

std::string folder_to_json(const sessions::Folder &folder) {
  common::JsonObjectWriter writer;
  writer.add("id", folder.id)
      .add("name", folder.name)
      .add("project_id", folder.project_id)
      .add("created_at", folder.created_at);
  return writer.str();
}

void ObserverNotificationSink::session_created(const sessions::Session &session) {
  observability::record_session(session.id, "created", visible(session));
}

void ObserverNotificationSink::session_updated(const sessions::Session &session) {
  observability::record_session(session.id, "updated", visible(session));
}

void ObserverNotificationSink::session_deleted(const std::string &session_id) {
  observability::record_session(session_id, "deleted", "archived");
}

void ObserverNotificationSink::folder_created(const sessions::Folder &folder) {
  observability::log_info("sessions", "Folder created: " + folder.name + " (" + folder.id + ")");
}

JsonlNotificationSink::JsonlNotificationSink(std::ostream &out) : out_(out) {}

void JsonlNotificationSink::write_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
}

void JsonlNotificationSink::session_created(const sessions::Session &session) {
  common::JsonObjectWriter writer;
  writer.add("event", "session_created").add_raw("session", session_to_json(session));
  write_line(writer.str());
}

void JsonlNotificationSink::session_updated(const sessions::Session &session) {
  common::JsonObjectWriter writer;
  writer.add("event", "session_updated").add_raw("session", session_to_json(session));
  write_line(writer.str());
}

void JsonlNotificationSink::session_deleted(const std::string &session_id) {
  common::JsonObjectWriter writer;
  writer.add("event", "session_deleted").add("session_id", session_id);
  write_line(writer.str());
}

void JsonlNotificationSink::folder_created(const sessions::Folder &folder) {
  common::JsonObjectWriter writer;
  writer.add("event", "folder_created").add_raw("folder", folder_to_json(folder));
  write_line(writer.str());
}

void FanoutNotificationSink::add(std::shared_ptr<NotificationSink> sink) {
  if (sink != nullptr) {
    sinks_.push_back(std::move(sink));
  }
}

void FanoutNotificationSink::session_created(const sessions::Session &session) {
  for (const auto &sink : sinks_) {
    sink->session_created(session);
  }
}

void FanoutNotificationSink::session_updated(const sessions::Session &session) {
  for (const auto &sink : sinks_) {
    sink->session_updated(session);
  }
}

void FanoutNotificationSink::session_deleted(const std::string &session_id) {
  for (const auto &sink : sinks_) {
    sink->session_deleted(session_id);
  }
}

void FanoutNotificationSink::folder_created(const sessions::Folder &folder) {
  for (const auto &sink : sinks_) {
    sink->folder_created(folder);
  }
}

} // namespace forkyard::events
