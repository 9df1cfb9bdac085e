#pragma once

#include "forkyard/sessions/session.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace forkyard::events {

/// Receives session lifecycle notifications for whatever front end is attached.
class NotificationSink {
public:
  virtual ~NotificationSink() = default;

  virtual void session_created(const sessions::Session &session) = 0;
  virtual void session_updated(const sessions::Session &session) = 0;
  virtual void session_deleted(const std::string &session_id) = 0;
  virtual void folder_created(const sessions::Folder &folder) = 0;
};

/// Forwards notifications to the global observer as SessionEvents.
class ObserverNotificationSink final : public NotificationSink {
public:
  void session_created(const sessions::Session &session) override;
  void session_updated(const sessions::Session &session) override;
  void session_deleted(const std::string &session_id) override;
  void folder_created(const sessions::Folder &folder) override;
};

/// Writes one JSON object per line: {"event":"session_created","session":{...}}.
class JsonlNotificationSink final : public NotificationSink {
public:
  explicit JsonlNotificationSink(std::ostream &out);

  void session_created(const sessions::Session &session) override;
  void session_updated(const sessions::Session &session) override;
  void session_deleted(const std::string &session_id) override;
  void folder_created(const sessions::Folder &folder) override;

private:
  void write_line(const std::string &line);

  std::ostream &out_;
  std::mutex mutex_;
};

class FanoutNotificationSink final : public NotificationSink {
public:
  void add(std::shared_ptr<NotificationSink> sink);

  void session_created(const sessions::Session &session) override;
  void session_updated(const sessions::Session &session) override;
  void session_deleted(const std::string &session_id) override;
  void folder_created(const sessions::Folder &folder) override;

private:
  std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

/// Session as a JSON object; the status is the user-visible one.
[[nodiscard]] std::string session_to_json(const sessions::Session &session);
[[nodiscard]] std::string folder_to_json(const sessions::Folder &folder);

} // namespace forkyard::events
