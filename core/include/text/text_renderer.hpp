#pragma once
/**
 * @file text_renderer.hpp
 * @brief Single-line text layout and coverage masks
 */

#include "text/font.hpp"
#include "text/types.hpp"

#include <string>

namespace MemeEngine::Text {

/// Advance width of a line of text, kerning included
[[nodiscard]] float measure_text_width(const FontFace &face,
                                       const std::string &text,
                                       float font_size);

/// Lay out and rasterize one line of text into a coverage mask
[[nodiscard]] TextMask rasterize_text(const FontFace &face,
                                      const std::string &text, float font_size);

/**
 * @brief Grow a mask by a disc of @p radius pixels (outline/stroke)
 *
 * The result is padded by the radius on every side; origin offsets are
 * adjusted so the logical box stays in place.
 */
[[nodiscard]] TextMask dilate(const TextMask &mask, int radius);

} // namespace MemeEngine::Text
