/**
 * @file generate_meme.cpp
 * @brief CLI: render caption text into a GIF using its paired template
 *
 * Usage:
 *   generate_meme <gif_path> [-t TEXT]... [-o OUTPUT] [--threads N]
 *                 [--font-dir DIR]... [--config FILE] [-v]
 */

#include "core/errors.hpp"
#include "engine/engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *COLOR_RESET = "\033[0m";
constexpr const char *COLOR_GREEN = "\033[32m";
constexpr const char *COLOR_RED = "\033[31m";
constexpr const char *COLOR_BOLD = "\033[1m";

enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_USAGE = 1,
  EXIT_FORMAT = 2,
  EXIT_VALIDATION = 3,
  EXIT_TEXT_COUNT = 4,
  EXIT_IO = 5,
  EXIT_OTHER = 6,
};

struct Arguments {
  std::filesystem::path gif_path;
  std::vector<std::string> texts;
  std::filesystem::path output;
  std::optional<unsigned> threads;
  std::vector<std::filesystem::path> font_dirs;
  std::filesystem::path config_file;
  bool verbose = false;
};

void print_usage() {
  std::cout << COLOR_BOLD << "Usage:" << COLOR_RESET << std::endl;
  std::cout << "  generate_meme <gif_path> [options]\n" << std::endl;
  std::cout << "  The template is read from <gif_path> with a .json extension."
            << std::endl
            << std::endl;
  std::cout << COLOR_BOLD << "Options:" << COLOR_RESET << std::endl;
  std::cout << "  -t, --text TEXT      Text for the next overlay (repeatable)"
            << std::endl;
  std::cout << "  -o, --output PATH    Output GIF (default <dir>/<name>_meme.gif)"
            << std::endl;
  std::cout << "      --threads N      Render worker threads (0 = all cores)"
            << std::endl;
  std::cout << "      --font-dir DIR   Extra font search directory (repeatable)"
            << std::endl;
  std::cout << "      --config FILE    Engine configuration JSON" << std::endl;
  std::cout << "  -v, --verbose        Print progress" << std::endl;
  std::cout << "  -h, --help           Show this help message" << std::endl;
}

void usage_error(const std::string &message) {
  std::cerr << COLOR_RED << "Error: " << message << COLOR_RESET << std::endl;
  std::cerr << "Run 'generate_meme --help' for usage." << std::endl;
}

/// 0 = parsed, 1 = usage error, 2 = help shown
int parse_arguments(int argc, char *argv[], Arguments &args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto next_value = [&](const char *flag) -> const char * {
      if (i + 1 >= argc) {
        usage_error(std::string(flag) + " requires a value");
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 2;
    } else if (arg == "-t" || arg == "--text") {
      const char *v = next_value("--text");
      if (!v)
        return 1;
      args.texts.emplace_back(v);
    } else if (arg == "-o" || arg == "--output") {
      const char *v = next_value("--output");
      if (!v)
        return 1;
      args.output = v;
    } else if (arg == "--threads") {
      const char *v = next_value("--threads");
      if (!v)
        return 1;
      char *end = nullptr;
      unsigned long n = std::strtoul(v, &end, 10);
      if (end == v || *end != '\0' || n > 1024) {
        usage_error(std::string("invalid thread count: ") + v);
        return 1;
      }
      args.threads = static_cast<unsigned>(n);
    } else if (arg == "--font-dir") {
      const char *v = next_value("--font-dir");
      if (!v)
        return 1;
      args.font_dirs.emplace_back(v);
    } else if (arg == "--config") {
      const char *v = next_value("--config");
      if (!v)
        return 1;
      args.config_file = v;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      usage_error("unknown option: " + arg);
      return 1;
    } else if (args.gif_path.empty()) {
      args.gif_path = arg;
    } else {
      usage_error("unexpected argument: " + arg);
      return 1;
    }
  }

  if (args.gif_path.empty()) {
    usage_error("missing <gif_path>");
    return 1;
  }
  return 0;
}

int fail(int code, const std::string &kind, const std::string &message) {
  std::cerr << COLOR_RED << "❌ " << kind << ": " << message << COLOR_RESET
            << std::endl;
  return code;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  Arguments args;
  int parse_result = parse_arguments(argc, argv, args);
  if (parse_result == 2) {
    return EXIT_OK;
  }
  if (parse_result != 0) {
    return EXIT_USAGE;
  }

  try {
    MemeEngine::EngineConfig config;
    if (!args.config_file.empty()) {
      config = MemeEngine::EngineConfig::from_json(args.config_file);
    }
    // Flags override the config file
    if (args.threads) {
      config.worker_threads = *args.threads;
    }
    config.font_dirs.insert(config.font_dirs.end(), args.font_dirs.begin(),
                            args.font_dirs.end());
    config.verbose = config.verbose || args.verbose;

    MemeEngine::Engine engine(config);
    auto written = engine.render_file(args.gif_path, args.texts, args.output);

    std::cout << COLOR_GREEN << "✅ " << written.string() << COLOR_RESET
              << std::endl;
    return EXIT_OK;
  } catch (const MemeEngine::TemplateFormatError &e) {
    return fail(EXIT_FORMAT, "Template format error", e.what());
  } catch (const MemeEngine::ValidationError &e) {
    return fail(EXIT_VALIDATION, "Validation error", e.what());
  } catch (const MemeEngine::TextCountError &e) {
    return fail(EXIT_TEXT_COUNT, "Too many texts", e.what());
  } catch (const MemeEngine::IOError &e) {
    return fail(EXIT_IO, "I/O error", e.what());
  } catch (const std::exception &e) {
    return fail(EXIT_OTHER, "Error", e.what());
  }
}
