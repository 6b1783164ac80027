/**
 * @file engine.cpp
 * @brief Core engine implementation
 */

#include "engine/engine.hpp"
#include "core/deterministic.hpp"
#include "core/errors.hpp"
#include "io/gif.hpp"
#include "text/font.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace MemeEngine {

using json = nlohmann::json;

// Configuration loading

EngineConfig EngineConfig::parse(const std::string &json_str) {
  EngineConfig config;
  try {
    json j = json::parse(json_str);
    if (!j.is_object()) {
      throw TemplateFormatError("Engine config must be a JSON object");
    }

    if (j.contains("worker_threads")) {
      config.worker_threads = j["worker_threads"].get<unsigned>();
    }
    if (j.contains("default_font_size")) {
      config.default_font_size = j["default_font_size"].get<double>();
      if (!(config.default_font_size > 0.0)) {
        throw TemplateFormatError("default_font_size must be positive");
      }
    }
    if (j.contains("font_dirs")) {
      for (const auto &dir : j["font_dirs"]) {
        config.font_dirs.emplace_back(dir.get<std::string>());
      }
    }
    config.output_suffix = j.value("output_suffix", config.output_suffix);
    config.verbose = j.value("verbose", config.verbose);
  } catch (const json::exception &e) {
    throw TemplateFormatError(std::string("Engine config error: ") + e.what());
  }
  return config;
}

EngineConfig EngineConfig::from_json(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOError("Cannot open config", path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw IOError("Failed to read config", path.string());
  }
  return parse(buffer.str());
}

// Engine implementation
struct Engine::Impl {
  EngineConfig config;
  Text::FontLibrary fonts;
  AnimationAssembler assembler;

  Impl(const EngineConfig &cfg)
      : config(cfg), fonts(cfg.font_dirs, cfg.verbose),
        assembler(fonts, cfg.worker_threads,
                  InterpolationDefaults{cfg.default_font_size}) {}
};

Engine::Engine() : Engine(EngineConfig{}) {}

Engine::Engine(const EngineConfig &config)
    : pimpl_(std::make_unique<Impl>(config)) {}

Engine::~Engine() = default;

Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

const EngineConfig &Engine::config() const noexcept { return pimpl_->config; }

Text::FontLibrary &Engine::fonts() noexcept { return pimpl_->fonts; }

Template Engine::load_template(const std::filesystem::path &gif_path) const {
  const auto json_path = paired_template_path(gif_path);
  if (!std::filesystem::exists(json_path)) {
    throw IOError("Template file not found", json_path.string());
  }
  return MemeEngine::load_template(json_path);
}

Animation Engine::load_animation(const std::filesystem::path &gif_path) const {
  return IO::load_gif(gif_path);
}

Animation Engine::render(const Template &tmpl, const Animation &base,
                         const std::vector<std::string> &texts,
                         const RenderOptions &options) {
  const auto start = std::chrono::steady_clock::now();
  if (pimpl_->config.verbose) {
    std::cout << "🎞  Rendering " << base.frame_count() << " frames with "
              << pimpl_->assembler.worker_threads() << " workers" << std::endl;
  }

  Animation out = pimpl_->assembler.render(tmpl, base, texts, options);

  if (pimpl_->config.verbose) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "✅ Rendered " << out.frame_count() << " frames in "
              << elapsed.count() << " ms" << std::endl;
  }
  return out;
}

std::filesystem::path
Engine::render_file(const std::filesystem::path &gif_path,
                    const std::vector<std::string> &texts,
                    const std::filesystem::path &output) {
  Template tmpl = load_template(gif_path);
  Animation base = load_animation(gif_path);
  Animation result = render(tmpl, base, texts);

  const auto out_path = output.empty() ? default_output_path(gif_path) : output;
  IO::save_gif(result, out_path);

  if (pimpl_->config.verbose) {
    std::cout << "✅ Wrote " << out_path.string() << std::endl;
  }
  return out_path;
}

std::filesystem::path
Engine::default_output_path(const std::filesystem::path &gif_path) const {
  auto out = gif_path;
  out.replace_filename(gif_path.stem().string() + pimpl_->config.output_suffix +
                       ".gif");
  return out;
}

bool Engine::validate_frame(const ImageBuffer &frame,
                            uint64_t expected_hash) const {
  return compute_frame_hash(frame) == expected_hash;
}

uint64_t Engine::compute_frame_hash(const ImageBuffer &frame) const {
  const std::array<uint32_t, 2> dims{frame.width, frame.height};
  return Deterministic::combine_hashes(
      Deterministic::compute_pixel_hash(frame.data),
      Deterministic::hash_values(dims));
}

} // namespace MemeEngine
