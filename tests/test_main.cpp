#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "test_harness.h"

int g_failures = 0;
std::string g_current_test;

void expect_true(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << std::endl;
    ++g_failures;
  }
}

void expect_eq(size_t actual, size_t expected, const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message
              << " (expected " << expected << ", got " << actual << ")" << std::endl;
    ++g_failures;
  }
}

void expect_str(const std::string& actual, const std::string& expected, const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message
              << " (expected \"" << expected << "\", got \"" << actual << "\")" << std::endl;
    ++g_failures;
  }
}

namespace {

std::vector<TestCase> collect_tests() {
  std::vector<TestCase> tests;
  register_field_scanner_tests(tests);
  register_palette_tests(tests);
  register_document_tests(tests);
  register_annotation_store_tests(tests);
  register_highlight_driver_tests(tests);
  register_highlight_mode_tests(tests);
  register_config_tests(tests);
  register_cli_utils_tests(tests);
  register_render_tests(tests);
  register_repl_tests(tests);
  return tests;
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  try {
    test.fn();
  } catch (const std::exception& ex) {
    std::cerr << "FAIL [" << g_current_test << "]: unexpected exception: " << ex.what()
              << std::endl;
    ++g_failures;
  }
  return g_failures;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = collect_tests();
  if (argc > 1) {
    std::string target = argv[1];
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  int total_failures = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
    }
  }

  if (total_failures > 0) {
    std::cerr << total_failures << " test(s) failed." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed." << std::endl;
  return EXIT_SUCCESS;
}
