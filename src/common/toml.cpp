#include "forkyard/common/toml.hpp"

#include "forkyard/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace forkyard::common {

namespace {

bool is_escaped(const std::string &text, const std::size_t index) {
  std::size_t backslashes = 0;
  for (std::size_t i = index; i > 0 && text[i - 1] == '\\'; --i) {
    ++backslashes;
  }
  return backslashes % 2 == 1;
}

std::string drop_comment(const std::string &line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"' && !is_escaped(line, i)) {
      quoted = !quoted;
    } else if (line[i] == '#' && !quoted) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

template <typename T> T parse_number(const std::string &raw, const T fallback) {
  const std::string normalized = trim(raw);
  T parsed{};
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_number<std::uint64_t>(it->second, fallback);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &what) {
    return Result<TomlDocument>::failure(ErrorKind::Configuration,
                                         what + " at line " + std::to_string(line_number));
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(drop_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return fail("Unterminated section header");
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return fail("Empty section name");
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return fail("Expected key = value");
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return fail("Missing key");
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '\n') {
      escaped += "\\n";
      continue;
    }
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace forkyard::common
