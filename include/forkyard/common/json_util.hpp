#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace forkyard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Reverse of json_escape; \uXXXX below 0x80 is decoded, anything else is kept verbatim.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// String value of a top-level or nested field, empty when absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Elements of a JSON array of strings; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Renders values as a JSON array of strings.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Top-level fields of a flat object. Strings are unescaped, other values are kept raw.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Builds a single-line JSON object in insertion order.
class JsonObjectWriter {
public:
  JsonObjectWriter &add(const std::string &key, const std::string &value);
  JsonObjectWriter &add(const std::string &key, const char *value);
  JsonObjectWriter &add(const std::string &key, std::int64_t value);
  JsonObjectWriter &add(const std::string &key, bool value);
  JsonObjectWriter &add_null(const std::string &key);
  JsonObjectWriter &add_raw(const std::string &key, const std::string &raw_json);

  [[nodiscard]] std::string str() const;

private:
  void key(const std::string &name);

  std::string body_;
};

} // namespace forkyard::common
