/**
 * @file compositor.cpp
 * @brief Frame compositing: background box, stroke and text fill
 */

#include "engine/compositor.hpp"
#include "core/color.hpp"
#include "core/errors.hpp"
#include "text/text_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace MemeEngine {

namespace {

Color::RGBA color_or(const std::string &hex, Color::RGBA fallback) {
  return Color::parse_hex(hex).value_or(fallback);
}

/// Left edge of the text box for an anchor x and alignment
double aligned_left(double x, double width, TextAlign align) {
  switch (align) {
  case TextAlign::Left:
    return x;
  case TextAlign::Right:
    return x - width;
  case TextAlign::Center:
  default:
    return x - width / 2.0;
  }
}

/// Blend a coverage mask with its logical box top-left at (left, top)
void draw_mask(ImageBuffer &img, const Text::TextMask &mask, long left,
               long top, Color::RGBA color) {
  const long x0 = left - mask.origin_x;
  const long y0 = top - mask.origin_y;

  for (int my = 0; my < mask.height; ++my) {
    long py = y0 + my;
    if (py < 0 || py >= static_cast<long>(img.height))
      continue;
    for (int mx = 0; mx < mask.width; ++mx) {
      long px = x0 + mx;
      if (px < 0 || px >= static_cast<long>(img.width))
        continue;
      uint8_t coverage = mask.coverage[static_cast<size_t>(my) * mask.width + mx];
      if (coverage == 0)
        continue;
      Color::blend_onto(img.pixel(static_cast<uint32_t>(px),
                                  static_cast<uint32_t>(py)),
                        color, coverage);
    }
  }
}

void draw_rect(ImageBuffer &img, long x, long y, long w, long h,
               Color::RGBA color) {
  const long x_end = std::min(x + w, static_cast<long>(img.width));
  const long y_end = std::min(y + h, static_cast<long>(img.height));
  for (long py = std::max(y, 0L); py < y_end; ++py) {
    for (long px = std::max(x, 0L); px < x_end; ++px) {
      Color::blend_onto(img.pixel(static_cast<uint32_t>(px),
                                  static_cast<uint32_t>(py)),
                        color, 255);
    }
  }
}

} // anonymous namespace

const std::string &overlay_text(const Template &tmpl, size_t index,
                                std::span<const std::string> texts) {
  if (index < texts.size()) {
    return texts[index];
  }
  return tmpl.text_templates().at(index).display_text();
}

Compositor::Compositor(Text::FontLibrary &fonts) : fonts_(fonts) {}

ImageBuffer Compositor::composite(const ImageBuffer &base, const Template &tmpl,
                                  std::span<const ResolvedProperties> resolved,
                                  std::span<const std::string> texts) const {
  if (texts.size() > tmpl.size()) {
    throw TextCountError(texts.size(), tmpl.size());
  }
  if (resolved.size() != tmpl.size()) {
    throw std::invalid_argument("Resolved properties do not match overlays");
  }

  // The base frame may be shared by other renders; draw on a copy
  ImageBuffer img = base;

  const auto &overlays = tmpl.text_templates();
  for (size_t i = 0; i < overlays.size(); ++i) {
    render_text_layer(img, overlays[i], resolved[i],
                      overlay_text(tmpl, i, texts));
  }

  return img;
}

TextBox Compositor::text_box(const TextTemplate &tt,
                             const ResolvedProperties &props,
                             const std::string &text) const {
  const Text::FontFace &face = fonts_.face(tt.font);
  const auto size = static_cast<float>(props.font_size);

  TextBox box;
  box.width = Text::measure_text_width(face, text, size);
  box.height = face.metrics(size).line_height();
  box.x = aligned_left(props.x, box.width, tt.align);
  box.y = props.y - box.height / 2.0; // y is the vertical center
  return box;
}

void Compositor::render_text_layer(ImageBuffer &img, const TextTemplate &tt,
                                   const ResolvedProperties &props,
                                   const std::string &text) const {
  const Text::FontFace &face = fonts_.face(tt.font);
  Text::TextMask mask =
      Text::rasterize_text(face, text, static_cast<float>(props.font_size));

  const long left = std::lround(aligned_left(props.x, mask.box_width, tt.align));
  const long top = std::lround(props.y - mask.box_height / 2.0);

  if (tt.background_color) {
    draw_rect(img, left - BACKGROUND_MARGIN, top - BACKGROUND_MARGIN,
              std::lround(mask.box_width) + 2 * BACKGROUND_MARGIN,
              std::lround(mask.box_height) + 2 * BACKGROUND_MARGIN,
              color_or(*tt.background_color, Color::Colors::Transparent));
  }

  if (tt.stroke_width > 0.0f) {
    int radius = static_cast<int>(std::ceil(tt.stroke_width));
    draw_mask(img, Text::dilate(mask, radius), left, top,
              color_or(tt.stroke_color, Color::Colors::Black));
  }

  draw_mask(img, mask, left, top, color_or(tt.color, Color::Colors::White));
}

} // namespace MemeEngine
