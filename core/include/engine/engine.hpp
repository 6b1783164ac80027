#pragma once
/**
 * @file engine.hpp
 * @brief Core Meme Engine interface
 */

#include "engine/animation.hpp"
#include "engine/assembler.hpp"
#include "engine/template.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace MemeEngine {

/// Engine configuration
struct EngineConfig {
  unsigned worker_threads = 0; // 0 = hardware concurrency
  double default_font_size = 50.0;
  std::vector<std::filesystem::path> font_dirs;
  std::string output_suffix = "_meme";
  bool verbose = false;

  /**
   * @brief Load a configuration file
   *
   * Keys: worker_threads, default_font_size, font_dirs, output_suffix,
   * verbose. Missing keys keep their defaults.
   * @throws IOError if unreadable, TemplateFormatError if malformed
   */
  static EngineConfig from_json(const std::filesystem::path &path);

  /// Parse configuration from a JSON string
  static EngineConfig parse(const std::string &json);
};

/**
 * @brief Main Meme Engine
 *
 * Loads template/GIF pairs, renders caller text into every frame and
 * writes the resulting GIF.
 */
class Engine {
public:
  /// Create engine with default configuration
  Engine();

  /// Create engine with custom configuration
  explicit Engine(const EngineConfig &config);

  /// Destructor
  ~Engine();

  // Move-only semantics
  Engine(Engine &&) noexcept;
  Engine &operator=(Engine &&) noexcept;
  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  [[nodiscard]] const EngineConfig &config() const noexcept;

  /// Fonts available to this engine
  [[nodiscard]] Text::FontLibrary &fonts() noexcept;

  /**
   * @brief Load the template paired with a GIF (same stem, .json)
   * @throws IOError when the pair file is missing
   */
  [[nodiscard]] Template load_template(const std::filesystem::path &gif_path) const;

  /// Decode a base GIF; throws IOError
  [[nodiscard]] Animation load_animation(const std::filesystem::path &gif_path) const;

  /**
   * @brief Render caller texts into every frame
   * @throws TextCountError, ValidationError, IOError, RenderCancelled
   */
  [[nodiscard]] Animation render(const Template &tmpl, const Animation &base,
                                 const std::vector<std::string> &texts,
                                 const RenderOptions &options = {});

  /**
   * @brief Full pipeline: load the pair, render, write the output GIF
   * @param output Output path; empty selects default_output_path()
   * @return Path written
   */
  std::filesystem::path render_file(const std::filesystem::path &gif_path,
                                    const std::vector<std::string> &texts,
                                    const std::filesystem::path &output = {});

  /// `<dir>/<stem><output_suffix>.gif`
  [[nodiscard]] std::filesystem::path
  default_output_path(const std::filesystem::path &gif_path) const;

  /**
   * @brief Compute deterministic hash for frame
   */
  [[nodiscard]] uint64_t compute_frame_hash(const ImageBuffer &frame) const;

  /**
   * @brief Validate deterministic frame hash
   * @param frame Frame to validate
   * @param expected_hash Expected hash value
   * @return True if frame matches expected hash
   */
  [[nodiscard]] bool validate_frame(const ImageBuffer &frame,
                                    uint64_t expected_hash) const;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

} // namespace MemeEngine
