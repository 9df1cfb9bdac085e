#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_common_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_sync_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_workspace_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_reconcile_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_sessions_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_naming_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_jobs_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_scheduler_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_observability_tests(std::vector<forkyard::tests::TestCase> &tests);
void register_cli_tests(std::vector<forkyard::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<forkyard::tests::TestCase> tests;
  register_config_tests(tests);
  register_common_tests(tests);
  register_sync_tests(tests);
  register_workspace_tests(tests);
  register_reconcile_tests(tests);
  register_sessions_tests(tests);
  register_naming_tests(tests);
  register_jobs_tests(tests);
  register_scheduler_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
