#pragma once

#include "forkyard/common/result.hpp"
#include "forkyard/naming/http_client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace forkyard::naming {

/// Lowercase, characters outside [a-z0-9 -] dropped, whitespace runs to '-', repeated dashes
/// collapsed, no leading or trailing dash, at most 30 characters.
[[nodiscard]] std::string to_workspace_name(const std::string &display_name);

/// Workspace name for a user supplied template: lowercase, whitespace runs to '-', anything
/// outside [a-z0-9-] dropped.
[[nodiscard]] std::string template_workspace_name(const std::string &name_template);

/// Keeps letters, digits, spaces and dashes; collapses whitespace; at most 30 characters.
[[nodiscard]] std::string sanitize_display_name(const std::string &raw);

/// First three words longer than two characters, capitalised. "New Task" when none qualify.
[[nodiscard]] std::string fallback_display_name(const std::string &prompt);

/// Produces a short human readable session name for a prompt. Never fails.
class NameSuggester {
public:
  virtual ~NameSuggester() = default;
  [[nodiscard]] virtual std::string suggest(const std::string &prompt) = 0;
};

class FallbackNameSuggester final : public NameSuggester {
public:
  [[nodiscard]] std::string suggest(const std::string &prompt) override;
};

struct AnthropicNamingOptions {
  std::string api_key;
  std::string model = "claude-3-haiku-20240307";
  std::string base_url = "https://api.anthropic.com";
  std::uint64_t timeout_ms = 10000;
};

/// Asks an Anthropic model for a 2-4 word name; any failure falls back to
/// fallback_display_name.
class AnthropicNameSuggester final : public NameSuggester {
public:
  AnthropicNameSuggester(AnthropicNamingOptions options,
                         std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string suggest(const std::string &prompt) override;

  /// Raw model answer, unsanitised.
  [[nodiscard]] common::Result<std::string> request(const std::string &prompt) const;

private:
  AnthropicNamingOptions options_;
  std::shared_ptr<HttpClient> http_client_;
};

[[nodiscard]] std::string build_naming_request(const std::string &prompt,
                                               const std::string &model);
[[nodiscard]] common::Result<std::string> parse_naming_response(const std::string &body);

} // namespace forkyard::naming
