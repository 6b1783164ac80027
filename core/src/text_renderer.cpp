/**
 * @file text_renderer.cpp
 * @brief Text layout and rasterization into coverage masks
 *
 * Glyphs come from a FontFace (stb_truetype or the built-in block face);
 * the compositor blends the resulting masks onto frames.
 */

#include "text/text_renderer.hpp"

#include <algorithm>
#include <cmath>

namespace MemeEngine::Text {

std::u32string decode_utf8(const std::string &text) {
  std::u32string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<uint8_t>(text[i]);
    char32_t cp = 0;
    size_t extra = 0;

    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      out.push_back(U'\uFFFD');
      ++i;
      continue;
    }

    if (i + extra >= text.size()) {
      out.push_back(U'\uFFFD'); // truncated sequence
      break;
    }

    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (!valid) {
      out.push_back(U'\uFFFD');
      ++i;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

// Measure text width
float measure_text_width(const FontFace &face, const std::string &text,
                         float font_size) {
  std::u32string cps = decode_utf8(text);
  float width = 0;

  for (size_t i = 0; i < cps.size(); ++i) {
    width += face.advance(cps[i], font_size);

    // Kerning
    if (i + 1 < cps.size()) {
      width += face.kerning(cps[i], cps[i + 1], font_size);
    }
  }

  return width;
}

TextMask rasterize_text(const FontFace &face, const std::string &text,
                        float font_size) {
  struct Placed {
    GlyphBitmap glyph;
    int x;
    int y;
  };

  std::u32string cps = decode_utf8(text);
  FontMetrics metrics = face.metrics(font_size);
  const int baseline = static_cast<int>(std::lround(metrics.ascent));

  std::vector<Placed> placed;
  placed.reserve(cps.size());
  float cursor_x = 0.0f;

  for (size_t i = 0; i < cps.size(); ++i) {
    GlyphBitmap glyph = face.rasterize(cps[i], font_size);
    if (!glyph.empty()) {
      int px = static_cast<int>(std::lround(cursor_x)) + glyph.x0;
      int py = baseline + glyph.y0;
      placed.push_back({std::move(glyph), px, py});
    }

    // Advance cursor
    cursor_x += face.advance(cps[i], font_size);
    if (i + 1 < cps.size()) {
      cursor_x += face.kerning(cps[i], cps[i + 1], font_size);
    }
  }

  TextMask mask;
  mask.box_width = cursor_x;
  mask.box_height = metrics.line_height();

  int min_x = 0;
  int min_y = 0;
  int max_x = static_cast<int>(std::ceil(mask.box_width));
  int max_y = static_cast<int>(std::ceil(mask.box_height));
  for (const auto &p : placed) {
    min_x = std::min(min_x, p.x);
    min_y = std::min(min_y, p.y);
    max_x = std::max(max_x, p.x + p.glyph.width);
    max_y = std::max(max_y, p.y + p.glyph.height);
  }

  mask.origin_x = -min_x;
  mask.origin_y = -min_y;
  mask.width = max_x - min_x;
  mask.height = max_y - min_y;
  mask.coverage.assign(static_cast<size_t>(mask.width) * mask.height, 0);

  // Blit glyphs; overlapping coverage keeps the maximum
  for (const auto &p : placed) {
    for (int gy = 0; gy < p.glyph.height; ++gy) {
      for (int gx = 0; gx < p.glyph.width; ++gx) {
        int mx = p.x + gx + mask.origin_x;
        int my = p.y + gy + mask.origin_y;
        uint8_t &dst = mask.coverage[static_cast<size_t>(my) * mask.width + mx];
        dst = std::max(dst, p.glyph.coverage[static_cast<size_t>(gy) *
                                                 p.glyph.width +
                                             gx]);
      }
    }
  }

  return mask;
}

TextMask dilate(const TextMask &mask, int radius) {
  if (radius <= 0) {
    return mask;
  }

  TextMask out;
  out.width = mask.width + 2 * radius;
  out.height = mask.height + 2 * radius;
  out.origin_x = mask.origin_x + radius;
  out.origin_y = mask.origin_y + radius;
  out.box_width = mask.box_width;
  out.box_height = mask.box_height;
  out.coverage.assign(static_cast<size_t>(out.width) * out.height, 0);

  const int r2 = radius * radius;
  for (int y = 0; y < out.height; ++y) {
    for (int x = 0; x < out.width; ++x) {
      uint8_t best = 0;
      for (int dy = -radius; dy <= radius && best < 255; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
          if (dx * dx + dy * dy > r2)
            continue;
          best = std::max(best, mask.at(x - radius + dx, y - radius + dy));
        }
      }
      out.coverage[static_cast<size_t>(y) * out.width + x] = best;
    }
  }
  return out;
}

} // namespace MemeEngine::Text
