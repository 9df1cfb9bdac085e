#include "forkyard/config/config.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace forkyard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".forkyard";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DATABASE_FILENAME = "forkyard.db";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("FORKYARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

// Existing environment wins over .env entries.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (is_valid_env_name(key)) {
      setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
    }
  }
}

void load_dotenv_files() {
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value == nullptr ? std::string() : std::string(value);
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  return static_cast<std::uint32_t>(doc.get_u64(key, fallback));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Configuration, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.details());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.details());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> database_path(const Config &config) {
  if (!common::trim(config.storage.database_path).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.storage.database_path)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.details());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / DATABASE_FILENAME);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const std::string db = env_or_empty("FORKYARD_DATABASE_PATH"); !db.empty()) {
    config.storage.database_path = db;
  }
  if (const std::string backend = env_or_empty("FORKYARD_QUEUE_BACKEND"); !backend.empty()) {
    config.queue.backend = backend;
  }
  if (const std::string observer = env_or_empty("FORKYARD_OBSERVABILITY"); !observer.empty()) {
    config.observability.backend = observer;
  }
  if (const std::string key = env_or_empty("ANTHROPIC_API_KEY"); !key.empty()) {
    config.naming.api_key = key;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.details());
  }
  const auto &doc = parsed.value();
  Config config;

  config.storage.database_path = doc.get_string("storage.database_path");

  config.workspace.folder = doc.get_string("workspace.folder", config.workspace.folder);
  config.workspace.git_binary = doc.get_string("workspace.git_binary", config.workspace.git_binary);

  config.queue.backend = common::to_lower(doc.get_string("queue.backend", config.queue.backend));
  config.queue.path = doc.get_string("queue.path");
  config.queue.session_concurrency =
      get_u32(doc, "queue.session_concurrency", config.queue.session_concurrency);
  config.queue.input_concurrency =
      get_u32(doc, "queue.input_concurrency", config.queue.input_concurrency);
  config.queue.continue_concurrency =
      get_u32(doc, "queue.continue_concurrency", config.queue.continue_concurrency);
  config.queue.poll_interval_ms =
      get_u32(doc, "queue.poll_interval_ms", config.queue.poll_interval_ms);

  config.panels.wait_attempts = get_u32(doc, "panels.wait_attempts", config.panels.wait_attempts);
  config.panels.wait_interval_ms =
      get_u32(doc, "panels.wait_interval_ms", config.panels.wait_interval_ms);

  config.reconcile.post_timeout_ms =
      doc.get_u64("reconcile.post_timeout_ms", config.reconcile.post_timeout_ms);
  config.reconcile.lock_timeout_ms =
      doc.get_u64("reconcile.lock_timeout_ms", config.reconcile.lock_timeout_ms);
  config.reconcile.rebase_timeout_ms =
      doc.get_u64("reconcile.rebase_timeout_ms", config.reconcile.rebase_timeout_ms);
  config.reconcile.squash_timeout_ms =
      doc.get_u64("reconcile.squash_timeout_ms", config.reconcile.squash_timeout_ms);

  config.naming.provider = common::to_lower(doc.get_string("naming.provider", config.naming.provider));
  config.naming.model = doc.get_string("naming.model", config.naming.model);
  config.naming.base_url = doc.get_string("naming.base_url", config.naming.base_url);
  config.naming.timeout_ms = doc.get_u64("naming.timeout_ms", config.naming.timeout_ms);
  if (doc.has("naming.api_key")) {
    config.naming.api_key = doc.get_string("naming.api_key");
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.details());
  }
  const auto &path = path_result.value();

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                             "Unable to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                             path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config, const bool include_secrets) {
  std::ostringstream out;
  out << "[storage]\n";
  out << "database_path = " << common::quote_toml_string(config.storage.database_path) << "\n";

  out << "\n[workspace]\n";
  out << "folder = " << common::quote_toml_string(config.workspace.folder) << "\n";
  out << "git_binary = " << common::quote_toml_string(config.workspace.git_binary) << "\n";

  out << "\n[queue]\n";
  out << "backend = " << common::quote_toml_string(config.queue.backend) << "\n";
  out << "path = " << common::quote_toml_string(config.queue.path) << "\n";
  out << "session_concurrency = " << config.queue.session_concurrency << "\n";
  out << "input_concurrency = " << config.queue.input_concurrency << "\n";
  out << "continue_concurrency = " << config.queue.continue_concurrency << "\n";
  out << "poll_interval_ms = " << config.queue.poll_interval_ms << "\n";

  out << "\n[panels]\n";
  out << "wait_attempts = " << config.panels.wait_attempts << "\n";
  out << "wait_interval_ms = " << config.panels.wait_interval_ms << "\n";

  out << "\n[reconcile]\n";
  out << "post_timeout_ms = " << config.reconcile.post_timeout_ms << "\n";
  out << "lock_timeout_ms = " << config.reconcile.lock_timeout_ms << "\n";
  out << "rebase_timeout_ms = " << config.reconcile.rebase_timeout_ms << "\n";
  out << "squash_timeout_ms = " << config.reconcile.squash_timeout_ms << "\n";

  out << "\n[naming]\n";
  out << "provider = " << common::quote_toml_string(config.naming.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.naming.model) << "\n";
  out << "base_url = " << common::quote_toml_string(config.naming.base_url) << "\n";
  out << "timeout_ms = " << config.naming.timeout_ms << "\n";
  if (config.naming.api_key.has_value()) {
    out << "api_key = "
        << common::quote_toml_string(include_secrets ? *config.naming.api_key : "***") << "\n";
  }

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Status::error(path_result.details());
  }
  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Status::error(dir.details());
    }
  }

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::ErrorKind::Configuration,
                                   "Unable to write temporary config file");
    }
    file << render_config(config, true);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(config.queue.backend);
  if (backend != "local" && backend != "sqlite") {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "Invalid queue.backend: " + config.queue.backend);
  }
  if (backend == "sqlite" && common::trim(config.queue.path).empty()) {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "queue.backend = \"sqlite\" requires queue.path");
  }
  if (config.queue.input_concurrency == 0 || config.queue.continue_concurrency == 0) {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "queue concurrency values must be at least 1");
  }
  if (config.panels.wait_attempts == 0) {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "panels.wait_attempts must be at least 1");
  }
  if (config.reconcile.lock_timeout_ms == 0) {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "reconcile.lock_timeout_ms must be positive");
  }
  if (common::trim(config.workspace.git_binary).empty()) {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "workspace.git_binary must not be empty");
  }

  const std::string provider = common::to_lower(config.naming.provider);
  if (provider != "anthropic" && provider != "fallback") {
    return Warnings::failure(common::ErrorKind::Configuration,
                             "Invalid naming.provider: " + config.naming.provider);
  }
  if (provider == "anthropic" &&
      (!config.naming.api_key.has_value() || common::trim(*config.naming.api_key).empty())) {
    warnings.push_back("naming.api_key is not set; session names will be derived from prompts");
  }

  const std::string level = config.observability.level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    warnings.push_back("Unknown observability.level '" + level + "', using info");
  }
  if (config.queue.session_concurrency > 32) {
    warnings.push_back("queue.session_concurrency above 32 may exhaust file descriptors");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace forkyard::config
