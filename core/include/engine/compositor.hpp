#pragma once
/**
 * @file compositor.hpp
 * @brief Draws resolved text overlays onto a copy of a base frame
 */

#include "engine/interpolation.hpp"
#include "engine/renderer.hpp"
#include "engine/template.hpp"
#include "text/font.hpp"

#include <span>
#include <string>

namespace MemeEngine {

/// Logical text box of an overlay in frame pixels
struct TextBox {
  double x = 0.0; ///< Left edge
  double y = 0.0; ///< Top edge
  double width = 0.0;
  double height = 0.0;

  [[nodiscard]] bool contains(double px, double py) const noexcept {
    return px >= x && px < x + width && py >= y && py < y + height;
  }
};

/// Margin of the background box around the text box, in pixels
inline constexpr int BACKGROUND_MARGIN = 10;

/**
 * @brief Frame compositor
 *
 * Overlays are drawn in declaration order: background box, stroke, fill.
 * The text of overlay i is texts[i] when supplied, else its placeholder.
 */
class Compositor {
public:
  explicit Compositor(Text::FontLibrary &fonts);

  /**
   * @brief Composite every overlay onto a copy of @p base
   * @param base Base frame, never modified
   * @param tmpl Template whose overlays are drawn
   * @param resolved Properties per overlay, same order as the template
   * @param texts Caller strings bound positionally to overlays
   * @return New RGBA buffer
   * @throws TextCountError if texts outnumber overlays
   */
  [[nodiscard]] ImageBuffer composite(const ImageBuffer &base,
                                      const Template &tmpl,
                                      std::span<const ResolvedProperties> resolved,
                                      std::span<const std::string> texts) const;

  /// Where an overlay's text lands for given properties (hit testing)
  [[nodiscard]] TextBox text_box(const TextTemplate &tt,
                                 const ResolvedProperties &props,
                                 const std::string &text) const;

private:
  void render_text_layer(ImageBuffer &img, const TextTemplate &tt,
                         const ResolvedProperties &props,
                         const std::string &text) const;

  Text::FontLibrary &fonts_;
};

/// Text for overlay @p index: caller string if supplied, else placeholder
[[nodiscard]] const std::string &
overlay_text(const Template &tmpl, size_t index,
             std::span<const std::string> texts);

} // namespace MemeEngine
