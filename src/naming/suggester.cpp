#include "forkyard/naming/suggester.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/json_util.hpp"
#include "forkyard/observability/global.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace forkyard::naming {

namespace {

constexpr std::size_t kMaxNameLength = 30;

bool is_lower_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
}

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

/// Collapses whitespace runs into a single `replacement`.
std::string squeeze_whitespace(const std::string &value, const char replacement) {
  std::string out;
  bool in_space = false;
  for (const char ch : value) {
    if (is_space(ch)) {
      if (!in_space) {
        out.push_back(replacement);
      }
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(ch);
  }
  return out;
}

std::string naming_instructions(const std::string &prompt) {
  return "You are a developer assistant that generates concise, descriptive session names.\n\n"
         "Rules:\n"
         "- Generate a short, descriptive name (2-4 words max)\n"
         "- Use normal spacing between words\n"
         "- Make it relevant to the coding task described\n"
         "- Keep it under 30 characters\n"
         "- Don't include numbers (those will be added for uniqueness)\n"
         "- Focus on the main feature/task being described\n\n"
         "Examples:\n"
         "- \"Fix user authentication bug\" -> \"Fix Auth Bug\"\n"
         "- \"Add dark mode toggle\" -> \"Dark Mode Toggle\"\n"
         "- \"Refactor payment system\" -> \"Refactor Payments\"\n"
         "- \"Update API documentation\" -> \"Update API Docs\"\n\n"
         "Generate a session name for this coding task: \"" +
         prompt + "\"\n\nRespond with ONLY the session name, nothing else.";
}

// Branch names may not start with a dash.
std::string trim_dashes(const std::string &name) {
  const auto first = name.find_first_not_of('-');
  if (first == std::string::npos) {
    return {};
  }
  return name.substr(first, name.find_last_not_of('-') - first + 1);
}

} // namespace

std::string to_workspace_name(const std::string &display_name) {
  std::string kept;
  for (const char raw : display_name) {
    const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    if (is_lower_alnum(ch) || ch == '-' || is_space(ch)) {
      kept.push_back(ch);
    }
  }
  std::string dashed;
  for (const char ch : squeeze_whitespace(kept, '-')) {
    if (ch == '-' && !dashed.empty() && dashed.back() == '-') {
      continue;
    }
    dashed.push_back(ch);
  }
  return trim_dashes(dashed.substr(0, kMaxNameLength));
}

std::string template_workspace_name(const std::string &name_template) {
  std::string out;
  for (const char ch : squeeze_whitespace(common::to_lower(name_template), '-')) {
    if (is_lower_alnum(ch) || ch == '-') {
      out.push_back(ch);
    }
  }
  return trim_dashes(out);
}

std::string sanitize_display_name(const std::string &raw) {
  std::string kept;
  for (const char ch : raw) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || is_space(ch)) {
      kept.push_back(ch);
    }
  }
  return common::trim(squeeze_whitespace(kept, ' ')).substr(0, kMaxNameLength);
}

std::string fallback_display_name(const std::string &prompt) {
  std::string cleaned;
  for (const char raw : prompt) {
    const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    cleaned.push_back(is_lower_alnum(ch) ? ch : ' ');
  }

  std::istringstream words(cleaned);
  std::vector<std::string> picked;
  std::string word;
  while (picked.size() < 3 && words >> word) {
    if (word.size() > 2) {
      word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
      picked.push_back(word);
    }
  }
  if (picked.empty()) {
    return "New Task";
  }
  std::string name = picked.front();
  for (std::size_t i = 1; i < picked.size(); ++i) {
    name += " " + picked[i];
  }
  return name;
}

std::string FallbackNameSuggester::suggest(const std::string &prompt) {
  return fallback_display_name(prompt);
}

std::string build_naming_request(const std::string &prompt, const std::string &model) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model) << "\",";
  body << "\"max_tokens\":50,";
  body << "\"temperature\":0.3,";
  body << "\"messages\":[{\"role\":\"user\",\"content\":\""
       << common::json_escape(naming_instructions(prompt)) << "\"}]";
  body << "}";
  return body.str();
}

common::Result<std::string> parse_naming_response(const std::string &body) {
  if (body.find("\"content\"") == std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorKind::External,
                                                "content field missing");
  }
  const std::string text = common::trim(common::json_get_string(body, "text"));
  if (text.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::External,
                                                "content[0].text missing");
  }
  return common::Result<std::string>::success(text);
}

AnthropicNameSuggester::AnthropicNameSuggester(AnthropicNamingOptions options,
                                               std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

common::Result<std::string> AnthropicNameSuggester::request(const std::string &prompt) const {
  if (options_.api_key.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Configuration,
                                                "Anthropic API key not configured");
  }
  if (http_client_ == nullptr) {
    return common::Result<std::string>::failure(common::ErrorKind::Configuration,
                                                "No HTTP client configured");
  }
  const HttpHeaders headers = {
      {"x-api-key", options_.api_key},
      {"anthropic-version", "2023-06-01"},
  };
  const auto reply =
      http_client_->post_json(options_.base_url + "/v1/messages", headers,
                              build_naming_request(prompt, options_.model), options_.timeout_ms);
  if (reply.timed_out) {
    return common::Result<std::string>::failure(common::ErrorKind::External,
                                                "naming request timed out");
  }
  if (reply.transport_error.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::External,
                                                *reply.transport_error);
  }
  if (!reply.succeeded()) {
    return common::Result<std::string>::failure(
        common::ErrorKind::External,
        "naming request failed with HTTP " + std::to_string(reply.status));
  }
  return parse_naming_response(reply.body);
}

std::string AnthropicNameSuggester::suggest(const std::string &prompt) {
  auto answer = request(prompt);
  if (answer.ok()) {
    const std::string name = sanitize_display_name(answer.value());
    if (!name.empty()) {
      return name;
    }
  } else if (answer.kind() != common::ErrorKind::Configuration) {
    observability::log_warn("naming", "Name suggestion failed: " + answer.error());
  }
  return fallback_display_name(prompt);
}

} // namespace forkyard::naming
