#pragma once
/**
 * @file assembler.hpp
 * @brief Renders every frame of a base animation through the compositor
 */

#include "engine/animation.hpp"
#include "engine/compositor.hpp"
#include "engine/interpolation.hpp"
#include "engine/template.hpp"
#include "text/font.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace MemeEngine {

/// Cooperative cancellation flag shared with a running render
class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
};

/// Called after each finished frame with (done, total)
using ProgressCallback = std::function<void(size_t, size_t)>;

struct RenderOptions {
  /// Frames are scheduled outward from this index when set
  std::optional<uint32_t> focus_frame;
  const CancellationToken *cancel = nullptr;
  ProgressCallback progress;
};

/**
 * @brief Animation assembler
 *
 * Frames are rendered by a fixed set of worker threads. Each result is
 * stored at its own frame index, so the output order, durations and loop
 * count always match the base animation.
 */
class AnimationAssembler {
public:
  /// @param worker_threads 0 selects the hardware concurrency
  AnimationAssembler(Text::FontLibrary &fonts, unsigned worker_threads = 0,
                     InterpolationDefaults defaults = {});

  /**
   * @brief Render all frames
   * @throws TextCountError, ValidationError, IOError, RenderCancelled
   */
  [[nodiscard]] Animation render(const Template &tmpl, const Animation &base,
                                 std::span<const std::string> texts,
                                 const RenderOptions &options = {}) const;

  /// Render a single frame, e.g. for previews
  [[nodiscard]] ImageBuffer render_frame(const Template &tmpl,
                                         const Animation &base,
                                         std::span<const std::string> texts,
                                         uint32_t index) const;

  [[nodiscard]] unsigned worker_threads() const noexcept { return workers_; }

private:
  void check_inputs(const Template &tmpl, const Animation &base,
                    std::span<const std::string> texts) const;

  Text::FontLibrary &fonts_;
  Compositor compositor_;
  unsigned workers_;
  InterpolationDefaults defaults_;
};

/**
 * @brief Frame visiting order that starts at @p start and alternates
 *        backward and forward: start, start-1, start+1, start-2, ...
 *
 * Indices outside [0, length) are skipped; every index appears once.
 */
[[nodiscard]] std::vector<uint32_t> spiral_order(uint32_t start,
                                                 uint32_t length);

} // namespace MemeEngine
