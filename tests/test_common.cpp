#include "test_framework.hpp"

#include "forkyard/common/fs.hpp"
#include "forkyard/common/json_util.hpp"
#include "forkyard/common/process.hpp"
#include "forkyard/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

void register_common_tests(std::vector<forkyard::tests::TestCase> &tests) {
  using forkyard::tests::require;
  namespace common = forkyard::common;

  tests.push_back({"toml_sections_comments_and_quotes", [] {
                     auto parsed = common::parse_toml(R"(
top = "level"
[queue]
backend = "sqlite" # trailing comment
path = "/tmp/a#b.db"
poll_interval_ms = 250
[naming]
api_key = "with \"quotes\""
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("top") == "level", "top-level key mismatch");
                     require(doc.get_string("queue.backend") == "sqlite", "comment should be dropped");
                     require(doc.get_string("queue.path") == "/tmp/a#b.db",
                             "hash inside quotes is not a comment");
                     require(doc.get_u64("queue.poll_interval_ms", 0) == 250, "integer mismatch");
                     require(doc.get_u64("queue.backend", 7) == 7, "non-number falls back");
                     require(doc.get_string("naming.api_key") == "with \"quotes\"",
                             "escaped quotes should be unescaped");
                     require(!doc.has("queue.missing"), "missing key should not exist");
                   }});

  tests.push_back({"toml_rejects_line_without_equals", [] {
                     auto parsed = common::parse_toml("[queue]\nbackend\n");
                     require(!parsed.ok(), "line without '=' should fail");
                     require(common::contains(parsed.error(), "line 2"), "error should name line 2");
                   }});

  tests.push_back({"json_flat_map_and_writer", [] {
                     const std::string json = common::JsonObjectWriter()
                                                  .add("name", "Fix \"auth\"\nbug")
                                                  .add("count", std::int64_t{3})
                                                  .add("enabled", true)
                                                  .add_null("folder")
                                                  .add_raw("files", common::json_string_array({"a.txt", "b.txt"}))
                                                  .str();
                     const auto flat = common::json_parse_flat(json);
                     require(flat.at("name") == "Fix \"auth\"\nbug", "string should round trip escapes");
                     require(flat.at("count") == "3", "numbers are kept raw");
                     require(flat.at("enabled") == "true", "booleans are kept raw");
                     require(flat.at("folder") == "null", "null is kept raw");
                     const auto files = common::json_parse_string_array(flat.at("files"));
                     require(files.size() == 2 && files[1] == "b.txt", "array should parse");
                   }});

  tests.push_back({"json_get_string_reads_nested_text", [] {
                     const std::string body =
                         R"({"id":"msg_1","content":[{"type":"text","text":"Fix Auth Bug"}]})";
                     require(common::json_get_string(body, "text") == "Fix Auth Bug",
                             "nested text field should be found");
                     require(common::json_get_string(body, "missing").empty(),
                             "missing field should be empty");
                   }});

  tests.push_back({"process_captures_output_and_exit_code", [] {
                     forkyard::testing::TempWorkspace workspace;
                     common::ProcessOptions options;
                     options.working_directory = workspace.path();
                     options.environment = {{"FORKYARD_TEST_VALUE", "from-parent"},
                                            {"HOME", "/forkyard-home"}};
                     auto result = common::run_shell("pwd; echo $FORKYARD_TEST_VALUE; echo home=$HOME; echo oops >&2; exit 3",
                                                     options);
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 3, "exit code should be captured");
                     require(!result.value().success(), "non-zero exit is not success");
                     require(common::contains(result.value().stdout_text, workspace.path().string()),
                             "command should run in the working directory");
                     require(common::contains(result.value().stdout_text, "from-parent"),
                             "environment should reach the child");
                     require(common::contains(result.value().stdout_text, "home=/forkyard-home\n"),
                             "overrides replace inherited variables");
                     require(common::trim(result.value().stderr_text) == "oops", "stderr mismatch");
                   }});

  tests.push_back({"process_times_out", [] {
                     common::ProcessOptions options;
                     options.timeout = std::chrono::milliseconds(200);
                     const auto started = std::chrono::steady_clock::now();
                     auto result = common::run_shell("sleep 5", options);
                     require(result.ok(), result.error());
                     require(result.value().timed_out, "sleep should time out");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(4),
                             "timeout should stop waiting early");
                   }});

  tests.push_back({"process_pipes_do_not_leak_into_concurrent_children", [] {
                     std::atomic<bool> stop{false};
                     std::vector<std::thread> sleepers;
                     for (int i = 0; i < 8; ++i) {
                       sleepers.emplace_back([&stop] {
                         while (!stop.load()) {
                           (void)common::run_process({"sleep", "1"});
                         }
                       });
                     }
                     auto worst = std::chrono::milliseconds(0);
                     for (int i = 0; i < 40; ++i) {
                       const auto started = std::chrono::steady_clock::now();
                       auto result = common::run_process({"true"});
                       const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started);
                       worst = std::max(worst, elapsed);
                       require(result.ok() && result.value().success(), "true should succeed");
                     }
                     stop = true;
                     for (auto &sleeper : sleepers) {
                       sleeper.join();
                     }
                     require(worst < std::chrono::milliseconds(800),
                             "short command waited on an unrelated child: " +
                                 std::to_string(worst.count()) + "ms");
                   }});

  tests.push_back({"process_reports_missing_binary_as_exit_127", [] {
                     auto result = common::run_process({"forkyard-definitely-missing-binary"});
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 127, "exec failure should exit 127");
                   }});

  tests.push_back({"generate_id_is_unique_uuid_layout", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 100; ++i) {
                       const auto id = common::generate_id();
                       require(id.size() == 36, "id should have 36 characters");
                       require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-',
                               "id should use 8-4-4-4-12 layout");
                       require(id[14] == '4', "version nibble should be 4: " + id);
                       require(std::string("89ab").find(id[19]) != std::string::npos,
                               "variant bits should be 10xx: " + id);
                       seen.insert(id);
                     }
                     require(seen.size() == 100, "ids should be unique");
                   }});

  tests.push_back({"rfc3339_millis_sorts_in_time_order", [] {
                     const auto base = std::chrono::system_clock::time_point(
                         std::chrono::milliseconds(1'700'000'000'005));
                     const auto earlier = common::format_rfc3339_millis(base);
                     const auto later =
                         common::format_rfc3339_millis(base + std::chrono::milliseconds(995));
                     require(earlier == "2023-11-14T22:13:20.005Z", "unexpected format: " + earlier);
                     require(earlier < later, "string order should follow time order");
                   }});
}
