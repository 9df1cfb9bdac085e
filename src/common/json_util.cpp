#include "forkyard/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace forkyard::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
    } else if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t matching_close(const std::string &json, const std::size_t open_pos) {
  const char open = json[open_pos];
  const char close = open == '{' ? '}' : ']';
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == open) {
      ++depth;
    } else if (ch == close && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// Position of the first value character after `"field":`, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t from = 0;
  while (true) {
    const auto key_pos = json.find(quoted, from);
    if (key_pos == std::string::npos) {
      return std::string::npos;
    }
    const auto pos = skip_ws(json, key_pos + quoted.size());
    if (pos < json.size() && json[pos] == ':') {
      return skip_ws(json, pos + 1);
    }
    from = key_pos + quoted.size();
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      if (i + 4 < raw.size()) {
        const unsigned long code = std::strtoul(raw.substr(i + 1, 4).c_str(), nullptr, 16);
        if (code < 0x80) {
          out.push_back(static_cast<char>(code));
          i += 4;
          break;
        }
      }
      out += "\\u";
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == '"') {
      const auto end = string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
      continue;
    }
    if (array_json[pos] == '{' || array_json[pos] == '[') {
      const auto end = matching_close(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
      continue;
    }
    ++pos;
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += "\"" + json_escape(values[i]) + "\"";
  }
  out.push_back(']');
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  std::size_t pos = skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto end = string_end(json, pos);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, end - pos - 1));
      pos = end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const auto end = matching_close(json, pos);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }
  return result;
}

void JsonObjectWriter::key(const std::string &name) {
  if (!body_.empty()) {
    body_.push_back(',');
  }
  body_ += "\"" + json_escape(name) + "\":";
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &name, const std::string &value) {
  key(name);
  body_ += "\"" + json_escape(value) + "\"";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &name, const char *value) {
  return add(name, std::string(value == nullptr ? "" : value));
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &name, const std::int64_t value) {
  key(name);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &name, const bool value) {
  key(name);
  body_ += value ? "true" : "false";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_null(const std::string &name) {
  key(name);
  body_ += "null";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_raw(const std::string &name, const std::string &raw_json) {
  key(name);
  body_ += raw_json;
  return *this;
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

} // namespace forkyard::common
