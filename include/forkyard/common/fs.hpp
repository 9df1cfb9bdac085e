#pragma once

#include "forkyard/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace forkyard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool contains(const std::string &value, const std::string &needle);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// UTC timestamp with millisecond precision, e.g. 2024-05-01T10:00:00.123Z.
/// Values sort lexicographically in time order.
[[nodiscard]] std::string format_rfc3339_millis(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string now_rfc3339();

[[nodiscard]] std::string random_hex(std::size_t bytes);
/// Random version 4 UUID, 8-4-4-4-12 lowercase hex.
[[nodiscard]] std::string generate_id();

} // namespace forkyard::common
