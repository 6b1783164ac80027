#pragma once
/**
 * @file animation.hpp
 * @brief Frame sequence with per-frame display durations
 */

#include "engine/renderer.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace MemeEngine {

/// One frame of an animated image
struct Frame {
  ImageBuffer image;
  uint32_t duration_ms = 100; ///< Display duration
};

/**
 * @brief Animated image: ordered frames sharing one size
 *
 * Base animations are read-only while a render is in flight.
 */
struct Animation {
  std::vector<Frame> frames;
  uint32_t width = 0;
  uint32_t height = 0;
  /// Repeat count written to the file; 0 loops forever, nullopt plays once
  std::optional<uint16_t> loop_count = 0;

  [[nodiscard]] size_t frame_count() const noexcept { return frames.size(); }
  [[nodiscard]] bool empty() const noexcept { return frames.empty(); }

  /// Sum of frame durations in milliseconds
  [[nodiscard]] uint64_t total_duration_ms() const noexcept;

  /// Append a frame, adopting its size if this is the first one
  void append(Frame frame);

  /// Uniform-color animation, handy for previews and tests
  static Animation solid(uint32_t width, uint32_t height, size_t frame_count,
                         uint32_t duration_ms, uint8_t r, uint8_t g, uint8_t b);
};

} // namespace MemeEngine
