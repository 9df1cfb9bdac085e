#include "forkyard/runtime/app.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/config/config.hpp"
#include "forkyard/jobs/local_pool.hpp"
#include "forkyard/jobs/sqlite_queue.hpp"
#include "forkyard/naming/http_client.hpp"
#include "forkyard/observability/factory.hpp"
#include "forkyard/observability/global.hpp"
#include "forkyard/sessions/sqlite_store.hpp"

namespace forkyard::runtime {

jobs::PoolWidths pool_widths(const config::QueueConfig &queue) {
  return jobs::PoolWidths{.create_session = queue.session_concurrency == 0
                                                ? jobs::platform_session_concurrency()
                                                : queue.session_concurrency,
                          .send_input = queue.input_concurrency,
                          .continue_session = queue.continue_concurrency};
}

workspace::ReconcileOptions reconcile_options(const config::ReconcileConfig &config) {
  workspace::ReconcileOptions options;
  options.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
  options.post_timeout = std::chrono::milliseconds(config.post_timeout_ms);
  options.rebase_timeout = std::chrono::milliseconds(config.rebase_timeout_ms);
  options.squash_timeout = std::chrono::milliseconds(config.squash_timeout_ms);
  return options;
}

std::shared_ptr<naming::NameSuggester> create_name_suggester(const config::NamingConfig &config) {
  if (config.provider == "anthropic" && config.api_key.has_value() && !config.api_key->empty()) {
    naming::AnthropicNamingOptions options;
    options.api_key = *config.api_key;
    options.model = config.model;
    options.base_url = config.base_url;
    options.timeout_ms = config.timeout_ms;
    return std::make_shared<naming::AnthropicNameSuggester>(
        std::move(options), std::make_shared<naming::CurlHttpClient>());
  }
  return std::make_shared<naming::FallbackNameSuggester>();
}

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.details());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Status RuntimeContext::initialize(std::shared_ptr<events::NotificationSink> sink) {
  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return common::Status::error(validated.details());
  }
  observability::set_global_observer(observability::create_observer(config_));
  for (const auto &warning : validated.value()) {
    observability::log_warn("config", warning);
  }

  auto db_path = config::database_path(config_);
  if (!db_path.ok()) {
    return common::Status::error(db_path.details());
  }
  auto store = std::make_shared<sessions::SqliteSessionStore>(db_path.value());
  if (auto opened = store->status(); !opened.ok()) {
    return opened;
  }
  store_ = std::move(store);

  sink_ = sink != nullptr ? std::move(sink) : std::make_shared<events::ObserverNotificationSink>();
  locks_ = std::make_shared<sync::MutexRegistry>(
      std::chrono::milliseconds(config_.reconcile.lock_timeout_ms));
  git_ = std::make_shared<workspace::GitRunner>(config_.workspace.git_binary);
  workspaces_ = std::make_shared<workspace::WorkspaceManager>(git_, config_.workspace.folder);
  reconciler_ = std::make_shared<workspace::Reconciler>(git_, locks_,
                                                        reconcile_options(config_.reconcile));
  diffs_ = std::make_shared<workspace::DiffCapture>(git_);
  sessions_ = std::make_shared<sessions::SessionManager>(store_, workspaces_, sink_);
  executions_ = std::make_shared<sessions::ExecutionTracker>(store_, diffs_, locks_);
  suggester_ = create_name_suggester(config_.naming);
  resolver_ = std::make_shared<naming::NameResolver>(store_, workspaces_);

  auto stopped = sessions_->initialize();
  if (!stopped.ok()) {
    return common::Status::error(stopped.details());
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<jobs::JobScheduler>>
RuntimeContext::create_scheduler(std::shared_ptr<agents::AgentController> controller,
                                 std::shared_ptr<agents::PanelDirectory> panels,
                                 std::shared_ptr<jobs::JobListener> listener) {
  using SchedulerResult = common::Result<std::unique_ptr<jobs::JobScheduler>>;
  if (store_ == nullptr) {
    return SchedulerResult::failure(common::ErrorKind::Internal,
                                    "Runtime not initialized");
  }

  const auto widths = pool_widths(config_.queue);
  std::unique_ptr<jobs::JobBackend> backend;
  if (config_.queue.backend == "sqlite") {
    auto queue = std::make_unique<jobs::SqliteJobQueue>(
        common::expand_path(config_.queue.path), widths,
        std::chrono::milliseconds(config_.queue.poll_interval_ms));
    if (auto opened = queue->status(); !opened.ok()) {
      return SchedulerResult::failure(opened.details());
    }
    backend = std::move(queue);
  } else {
    backend = std::make_unique<jobs::LocalWorkerPool>(widths);
  }

  jobs::SchedulerServices services;
  services.store = store_;
  services.sessions = sessions_;
  services.workspaces = workspaces_;
  services.resolver = resolver_;
  services.suggester = suggester_;
  services.locks = locks_;
  services.sink = sink_;
  if (controller == nullptr) {
    controller = std::make_shared<agents::DetachedAgentController>(sessions_);
  }
  services.agents = std::move(controller);
  services.panels = std::move(panels);
  services.listener = std::move(listener);
  services.executions = executions_;

  jobs::SchedulerOptions options;
  options.panel_wait_attempts = config_.panels.wait_attempts;
  options.panel_wait_interval = std::chrono::milliseconds(config_.panels.wait_interval_ms);

  auto scheduler =
      std::make_unique<jobs::JobScheduler>(std::move(services), std::move(backend), options);
  if (auto started = scheduler->start(); !started.ok()) {
    return SchedulerResult::failure(started.details());
  }
  return SchedulerResult::success(std::move(scheduler));
}

} // namespace forkyard::runtime
