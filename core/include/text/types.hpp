#pragma once
/**
 * @file types.hpp
 * @brief Shared types for text rasterization
 *
 * Common types used by font faces, the text rasterizer and the compositor.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace MemeEngine::Text {

/// Vertical font metrics at one pixel height
struct FontMetrics {
  float ascent = 0.0f;   ///< Baseline to top, positive
  float descent = 0.0f;  ///< Baseline to bottom, positive
  float line_gap = 0.0f;

  [[nodiscard]] float line_height() const noexcept { return ascent + descent; }
};

/// 8-bit coverage bitmap of one glyph
struct GlyphBitmap {
  std::vector<uint8_t> coverage;
  int width = 0;
  int height = 0;
  int x0 = 0; ///< Left edge relative to the pen position
  int y0 = 0; ///< Top edge relative to the baseline (negative is above)

  [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }
};

/**
 * @brief Coverage mask of a laid-out line of text
 *
 * The logical text box (advance width by ascent + descent) starts at
 * (origin_x, origin_y) inside the mask; glyph overhang may extend past it.
 */
struct TextMask {
  std::vector<uint8_t> coverage;
  int width = 0;
  int height = 0;
  int origin_x = 0;
  int origin_y = 0;
  float box_width = 0.0f;
  float box_height = 0.0f;

  [[nodiscard]] uint8_t at(int x, int y) const noexcept {
    if (x < 0 || y < 0 || x >= width || y >= height)
      return 0;
    return coverage[static_cast<size_t>(y) * width + x];
  }
};

/// Decode UTF-8 into code points; invalid bytes become U+FFFD
[[nodiscard]] std::u32string decode_utf8(const std::string &text);

} // namespace MemeEngine::Text
