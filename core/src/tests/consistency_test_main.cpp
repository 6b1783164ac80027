/**
 * @file consistency_test_main.cpp
 * @brief CLI entry point for consistency testing
 *
 * Usage:
 *   meme_consistency --generate [output_path]
 *   meme_consistency --validate [golden_path]
 *   meme_consistency --self-check [threads]
 *   meme_consistency --list
 *   meme_consistency --help
 */

#include "engine/engine.hpp"
#include "testing/consistency_test.hpp"

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>

using namespace MemeEngine::Testing;

constexpr const char *COLOR_RESET = "\033[0m";
constexpr const char *COLOR_GREEN = "\033[32m";
constexpr const char *COLOR_RED = "\033[31m";
constexpr const char *COLOR_YELLOW = "\033[33m";
constexpr const char *COLOR_CYAN = "\033[36m";
constexpr const char *COLOR_BOLD = "\033[1m";

void print_header() {
  std::cout << COLOR_BOLD << COLOR_CYAN;
  std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║             MemeEngine Consistency Test Runner                ║
║            Golden Hash & Parallel Render Validation           ║
╚═══════════════════════════════════════════════════════════════╝
)" << COLOR_RESET
            << std::endl;
}

void print_usage() {
  std::cout << COLOR_BOLD << "Usage:" << COLOR_RESET << std::endl;
  std::cout << "  meme_consistency --generate [output.json]" << std::endl;
  std::cout << "      Generate golden reference from current platform\n"
            << std::endl;
  std::cout << "  meme_consistency --validate <golden.json>" << std::endl;
  std::cout << "      Validate current build against golden reference\n"
            << std::endl;
  std::cout << "  meme_consistency --self-check [threads]" << std::endl;
  std::cout << "      Compare single-threaded and multi-threaded renders\n"
            << std::endl;
  std::cout << "  meme_consistency --list" << std::endl;
  std::cout << "      List all built-in test cases\n" << std::endl;
  std::cout << "  meme_consistency --help" << std::endl;
  std::cout << "      Show this help message\n" << std::endl;
}

void print_test_list() {
  auto tests = ConsistencyTestRunner::builtin_tests();

  std::cout << COLOR_BOLD << "Built-in Test Cases:" << COLOR_RESET << std::endl;
  std::cout << std::string(60, '-') << std::endl;

  for (const auto &test : tests) {
    std::cout << COLOR_CYAN << "  • " << test.name << COLOR_RESET << std::endl;
    std::cout << "    Resolution: " << test.width << "x" << test.height
              << std::endl;
    std::cout << "    Frames: " << test.frame_count << " x "
              << test.duration_ms << " ms" << std::endl;
    std::cout << "    Texts: ";
    for (size_t i = 0; i < test.texts.size(); ++i) {
      if (i > 0)
        std::cout << ", ";
      std::cout << '"' << test.texts[i] << '"';
    }
    std::cout << std::endl;
    std::cout << std::endl;
  }
}

void print_result(const ConsistencyResult &result) {
  if (result.passed) {
    std::cout << COLOR_GREEN << "  ✓ " << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << "  ✗ " << COLOR_RESET;
  }

  std::cout << COLOR_BOLD << result.test_name << COLOR_RESET;
  std::cout << " [" << result.matched_frames << "/" << result.total_frames
            << " frames]";

  if (result.passed) {
    std::cout << COLOR_GREEN << " PASSED" << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << " FAILED" << COLOR_RESET;
  }
  std::cout << std::endl;

  for (const auto &failure : result.failures) {
    std::cout << COLOR_YELLOW << "      → " << failure << COLOR_RESET
              << std::endl;
  }
}

/// Returns true when every result passed
bool print_summary(const std::vector<ConsistencyResult> &results) {
  size_t passed = 0;
  size_t total = results.size();
  size_t total_frames = 0;
  size_t matched_frames = 0;

  for (const auto &r : results) {
    if (r.passed)
      ++passed;
    total_frames += r.total_frames;
    matched_frames += r.matched_frames;
  }

  std::cout << std::endl;
  std::cout << std::string(60, '=') << std::endl;
  std::cout << COLOR_BOLD << "Summary:" << COLOR_RESET << std::endl;
  std::cout << "  Tests:  " << passed << "/" << total;
  if (passed == total) {
    std::cout << COLOR_GREEN << " (100%)" << COLOR_RESET;
  } else {
    std::cout << COLOR_RED << " (" << (passed * 100 / total) << "%)"
              << COLOR_RESET;
  }
  std::cout << std::endl;

  std::cout << "  Frames: " << matched_frames << "/" << total_frames;
  if (matched_frames == total_frames) {
    std::cout << COLOR_GREEN << " (100%)" << COLOR_RESET;
  } else if (total_frames > 0) {
    std::cout << COLOR_RED << " (" << (matched_frames * 100 / total_frames)
              << "%)" << COLOR_RESET;
  }
  std::cout << std::endl;
  std::cout << std::string(60, '=') << std::endl;

  if (passed == total) {
    std::cout << COLOR_GREEN << COLOR_BOLD
              << "✓ All tests passed! Consistency verified." << COLOR_RESET
              << std::endl;
  } else {
    std::cout << COLOR_RED << COLOR_BOLD
              << "✗ Some tests failed. See failures above." << COLOR_RESET
              << std::endl;
  }
  return passed == total;
}

int report(const std::vector<ConsistencyResult> &results) {
  std::cout << "\r" << std::string(60, ' ') << "\r"; // Clear progress line

  std::cout << COLOR_BOLD << "Results:" << COLOR_RESET << std::endl;
  for (const auto &result : results) {
    print_result(result);
  }
  return print_summary(results) ? 0 : 1;
}

int main(int argc, char *argv[]) {
  print_header();

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string mode = argv[1];

  // --help
  if (mode == "--help" || mode == "-h") {
    print_usage();
    return 0;
  }

  // --list
  if (mode == "--list" || mode == "-l") {
    print_test_list();
    return 0;
  }

  // Each case gets its own engine so worker counts stay independent
  auto render_fn = [](const TestCase &test,
                      unsigned worker_threads) -> MemeEngine::Animation {
    MemeEngine::EngineConfig config;
    config.worker_threads = worker_threads;
    MemeEngine::Engine engine(config);

    auto tmpl = MemeEngine::Template::from_json(test.template_json);
    return engine.render(tmpl, test.base_animation(), test.texts);
  };

  ConsistencyTestRunner runner(render_fn);
  runner.add_tests(ConsistencyTestRunner::builtin_tests());

  runner.set_progress_callback(
      [](size_t current, size_t total, const std::string &test) {
        std::cout << "\r" << COLOR_CYAN << "[" << current << "/" << total << "]"
                  << COLOR_RESET << " Testing: " << test << "...          "
                  << std::flush;
      });

  // --generate
  if (mode == "--generate" || mode == "-g") {
    std::string output_path = "golden_reference.json";
    if (argc >= 3) {
      output_path = argv[2];
    }

    std::cout << "Generating golden reference..." << std::endl;
    std::cout << "Platform: " << platform_string() << std::endl;
    std::cout << "Output:   " << output_path << std::endl;
    std::cout << std::endl;

    int rc = report(runner.generate_golden(output_path));

    std::cout << std::endl;
    std::cout << "Golden reference saved to: " << COLOR_CYAN << output_path
              << COLOR_RESET << std::endl;
    return rc;
  }

  // --validate
  if (mode == "--validate" || mode == "-v") {
    if (argc < 3) {
      std::cerr << COLOR_RED
                << "Error: --validate requires golden reference path"
                << COLOR_RESET << std::endl;
      print_usage();
      return 1;
    }

    std::string golden_path = argv[2];

    std::cout << "Validating against golden reference..." << std::endl;
    std::cout << "Platform: " << platform_string() << std::endl;
    std::cout << "Golden:   " << golden_path << std::endl;
    std::cout << std::endl;

    return report(runner.validate(golden_path));
  }

  // --self-check
  if (mode == "--self-check" || mode == "-s") {
    unsigned threads = 4;
    if (argc >= 3) {
      char *end = nullptr;
      unsigned long parsed = std::strtoul(argv[2], &end, 10);
      if (end == argv[2] || *end != '\0' || parsed < 2 || parsed > 256) {
        std::cerr << COLOR_RED << "Error: thread count must be 2-256"
                  << COLOR_RESET << std::endl;
        return 1;
      }
      threads = static_cast<unsigned>(parsed);
    }

    std::cout << "Comparing 1-thread and " << threads
              << "-thread renders..." << std::endl;
    std::cout << std::endl;

    return report(runner.self_check(threads));
  }

  std::cerr << COLOR_RED << "Unknown mode: " << mode << COLOR_RESET
            << std::endl;
  print_usage();
  return 1;
}
