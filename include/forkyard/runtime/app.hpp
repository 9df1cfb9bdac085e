#pragma once

#include "forkyard/agents/panels.hpp"
#include "forkyard/common/result.hpp"
#include "forkyard/config/schema.hpp"
#include "forkyard/events/notifier.hpp"
#include "forkyard/jobs/scheduler.hpp"
#include "forkyard/naming/resolver.hpp"
#include "forkyard/naming/suggester.hpp"
#include "forkyard/sessions/execution_tracker.hpp"
#include "forkyard/sessions/manager.hpp"
#include "forkyard/sessions/store.hpp"
#include "forkyard/sync/mutex_registry.hpp"
#include "forkyard/workspace/diff.hpp"
#include "forkyard/workspace/git.hpp"
#include "forkyard/workspace/manager.hpp"
#include "forkyard/workspace/reconcile.hpp"

#include <memory>

namespace forkyard::runtime {

/// Owns the configuration and builds the shared services from it.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the global observer, opens the session database and wires every service.
  /// Sessions left active by a previous process are stopped.
  [[nodiscard]] common::Status initialize(std::shared_ptr<events::NotificationSink> sink = nullptr);

  /// Builds a scheduler over the configured backend. Without an agent controller sessions are
  /// left for the user to drive by hand.
  [[nodiscard]] common::Result<std::unique_ptr<jobs::JobScheduler>>
  create_scheduler(std::shared_ptr<agents::AgentController> controller = nullptr,
                   std::shared_ptr<agents::PanelDirectory> panels = nullptr,
                   std::shared_ptr<jobs::JobListener> listener = nullptr);

  [[nodiscard]] const std::shared_ptr<sessions::SessionStore> &store() const { return store_; }
  [[nodiscard]] const std::shared_ptr<sessions::SessionManager> &sessions() const {
    return sessions_;
  }
  [[nodiscard]] const std::shared_ptr<workspace::WorkspaceManager> &workspaces() const {
    return workspaces_;
  }
  [[nodiscard]] const std::shared_ptr<workspace::Reconciler> &reconciler() const {
    return reconciler_;
  }
  [[nodiscard]] const std::shared_ptr<sessions::ExecutionTracker> &executions() const {
    return executions_;
  }
  [[nodiscard]] const std::shared_ptr<sync::MutexRegistry> &locks() const { return locks_; }

private:
  config::Config config_;
  std::shared_ptr<events::NotificationSink> sink_;
  std::shared_ptr<sync::MutexRegistry> locks_;
  std::shared_ptr<workspace::GitRunner> git_;
  std::shared_ptr<workspace::WorkspaceManager> workspaces_;
  std::shared_ptr<workspace::Reconciler> reconciler_;
  std::shared_ptr<workspace::DiffCapture> diffs_;
  std::shared_ptr<sessions::SessionStore> store_;
  std::shared_ptr<sessions::SessionManager> sessions_;
  std::shared_ptr<sessions::ExecutionTracker> executions_;
  std::shared_ptr<naming::NameSuggester> suggester_;
  std::shared_ptr<naming::NameResolver> resolver_;
};

/// Pool widths from [queue], with 0 replaced by the platform default.
[[nodiscard]] jobs::PoolWidths pool_widths(const config::QueueConfig &queue);

/// Reconciler timeouts from [reconcile].
[[nodiscard]] workspace::ReconcileOptions reconcile_options(const config::ReconcileConfig &config);

[[nodiscard]] std::shared_ptr<naming::NameSuggester>
create_name_suggester(const config::NamingConfig &config);

} // namespace forkyard::runtime
