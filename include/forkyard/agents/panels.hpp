#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/sessions/manager.hpp"
#include "forkyard/sessions/session.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forkyard::agents {

/// An agent tab attached to a session.
struct Panel {
  std::string id;
  std::string session_id;
  sessions::ToolKind tool = sessions::ToolKind::Claude;
};

class PanelDirectory {
public:
  virtual ~PanelDirectory() = default;

  /// Empty when the session has no panel for the tool yet.
  [[nodiscard]] virtual common::Result<std::optional<Panel>>
  find_panel(const std::string &session_id, sessions::ToolKind tool) const = 0;
};

/// Starts and feeds agent processes. Panel-scoped and session-scoped entry points are separate
/// operations; callers pick one explicitly.
class AgentController {
public:
  virtual ~AgentController() = default;

  [[nodiscard]] virtual common::Status start_panel(const Panel &panel,
                                                   const sessions::Session &session,
                                                   const std::string &prompt) = 0;
  [[nodiscard]] virtual common::Status
  continue_panel(const Panel &panel, const sessions::Session &session,
                 const std::vector<sessions::ConversationMessage> &history,
                 const std::string &prompt) = 0;
  [[nodiscard]] virtual common::Status send_input_to_panel(const Panel &panel,
                                                           const std::string &input) = 0;

  [[nodiscard]] virtual common::Status start_session(const sessions::Session &session,
                                                     const std::string &prompt) = 0;
  [[nodiscard]] virtual common::Status
  continue_session(const sessions::Session &session,
                   const std::vector<sessions::ConversationMessage> &history,
                   const std::string &prompt) = 0;
  [[nodiscard]] virtual common::Status send_input(const sessions::Session &session,
                                                  const std::string &input) = 0;
};

/// Polls a PanelDirectory until the panel shows up. Gives up with ErrorKind::NotFound.
class PanelWaiter {
public:
  PanelWaiter(std::shared_ptr<PanelDirectory> panels, std::uint32_t attempts,
              std::chrono::milliseconds interval);

  [[nodiscard]] common::Result<Panel> wait_for(const std::string &session_id,
                                               sessions::ToolKind tool) const;

private:
  std::shared_ptr<PanelDirectory> panels_;
  std::uint32_t attempts_;
  std::chrono::milliseconds interval_;
};

/// Used when no agent host is attached. Marks the session stopped with a hint telling the
/// user how to run the agent in the workspace by hand.
class DetachedAgentController final : public AgentController {
public:
  explicit DetachedAgentController(std::shared_ptr<sessions::SessionManager> sessions);

  common::Status start_panel(const Panel &panel, const sessions::Session &session,
                             const std::string &prompt) override;
  common::Status continue_panel(const Panel &panel, const sessions::Session &session,
                                const std::vector<sessions::ConversationMessage> &history,
                                const std::string &prompt) override;
  common::Status send_input_to_panel(const Panel &panel, const std::string &input) override;

  common::Status start_session(const sessions::Session &session,
                               const std::string &prompt) override;
  common::Status continue_session(const sessions::Session &session,
                                  const std::vector<sessions::ConversationMessage> &history,
                                  const std::string &prompt) override;
  common::Status send_input(const sessions::Session &session, const std::string &input) override;

private:
  common::Status park(const sessions::Session &session);

  std::shared_ptr<sessions::SessionManager> sessions_;
};

/// Executable name of the agent CLI for a tool; empty for ToolKind::None.
[[nodiscard]] std::string tool_command(sessions::ToolKind tool);

} // namespace forkyard::agents
