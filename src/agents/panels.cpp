#include "forkyard/agents/panels.hpp"

#include "forkyard/observability/global.hpp"

#include <thread>

namespace forkyard::agents {

std::string tool_command(const sessions::ToolKind tool) {
  switch (tool) {
  case sessions::ToolKind::Claude:
    return "claude";
  case sessions::ToolKind::Codex:
    return "codex";
  case sessions::ToolKind::None:
    return "";
  }
  return "";
}

PanelWaiter::PanelWaiter(std::shared_ptr<PanelDirectory> panels, const std::uint32_t attempts,
                         const std::chrono::milliseconds interval)
    : panels_(std::move(panels)), attempts_(attempts), interval_(interval) {}

common::Result<Panel> PanelWaiter::wait_for(const std::string &session_id,
                                            const sessions::ToolKind tool) const {
  if (panels_ == nullptr) {
    return common::Result<Panel>::failure(common::ErrorKind::Configuration,
                                          "No panel directory configured");
  }
  for (std::uint32_t attempt = 0; attempt < attempts_; ++attempt) {
    auto found = panels_->find_panel(session_id, tool);
    if (!found.ok()) {
      return common::Result<Panel>::failure(found.details());
    }
    if (found.value().has_value()) {
      return common::Result<Panel>::success(*found.value());
    }
    if (attempt + 1 < attempts_) {
      std::this_thread::sleep_for(interval_);
    }
  }
  return common::Result<Panel>::failure(
      common::ErrorKind::NotFound,
      "No " + std::string(sessions::to_string(tool)) + " panel for session " + session_id +
          " after " + std::to_string(attempts_) + " attempts");
}

DetachedAgentController::DetachedAgentController(
    std::shared_ptr<sessions::SessionManager> sessions)
    : sessions_(std::move(sessions)) {}

common::Status DetachedAgentController::park(const sessions::Session &session) {
  const std::string command = tool_command(session.tool);
  const std::string hint = command.empty()
                               ? "Agent not attached"
                               : "Agent not attached; run " + command + " in " +
                                     session.workspace_path;
  auto updated = sessions_->set_status(session.id, sessions::VisibleStatus::Stopped, hint);
  if (!updated.ok()) {
    return common::Status::error(updated.details());
  }
  observability::log_info("agents", session.name + ": " + hint);
  return common::Status::success();
}

common::Status DetachedAgentController::start_panel(const Panel &, const sessions::Session &session,
                                                    const std::string &) {
  return park(session);
}

common::Status
DetachedAgentController::continue_panel(const Panel &, const sessions::Session &session,
                                        const std::vector<sessions::ConversationMessage> &,
                                        const std::string &) {
  return park(session);
}

common::Status DetachedAgentController::send_input_to_panel(const Panel &panel,
                                                            const std::string &) {
  return common::Status::error(common::ErrorKind::External,
                               "Panel " + panel.id + " has no running agent");
}

common::Status DetachedAgentController::start_session(const sessions::Session &session,
                                                      const std::string &) {
  return park(session);
}

common::Status
DetachedAgentController::continue_session(const sessions::Session &session,
                                          const std::vector<sessions::ConversationMessage> &,
                                          const std::string &) {
  return park(session);
}

common::Status DetachedAgentController::send_input(const sessions::Session &session,
                                                   const std::string &) {
  return common::Status::error(common::ErrorKind::External,
                               "Session " + session.id + " has no running agent");
}

} // namespace forkyard::agents
