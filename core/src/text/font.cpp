/**
 * @file font.cpp
 * @brief Font faces (stb_truetype and built-in block) and font lookup
 */

#include "text/font.hpp"
#include "core/errors.hpp"
#include "engine/template.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb/stb_truetype.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>

namespace MemeEngine::Text {

// ============================================================================
// TrueTypeFace
// ============================================================================

struct TrueTypeFace::Impl {
  std::string name;
  std::vector<uint8_t> data; // stbtt_fontinfo points into this buffer
  stbtt_fontinfo info{};

  [[nodiscard]] float scale(float pixel_height) const {
    return stbtt_ScaleForPixelHeight(&info, pixel_height);
  }
};

std::unique_ptr<TrueTypeFace>
TrueTypeFace::from_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw IOError("Cannot open font file", path.string());
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw IOError("Failed to read font file", path.string());
  }
  return std::make_unique<TrueTypeFace>(path.string(), std::move(data));
}

TrueTypeFace::TrueTypeFace(std::string name, std::vector<uint8_t> data)
    : pimpl_(std::make_unique<Impl>()) {
  pimpl_->name = std::move(name);
  pimpl_->data = std::move(data);

  if (pimpl_->data.empty()) {
    throw IOError("Empty font file", pimpl_->name);
  }
  // Offset table header
  if (pimpl_->data.size() < 12) {
    throw IOError("Truncated font file", pimpl_->name);
  }
  int offset = stbtt_GetFontOffsetForIndex(pimpl_->data.data(), 0);
  if (offset < 0) {
    throw IOError("Invalid font file format", pimpl_->name);
  }
  if (!stbtt_InitFont(&pimpl_->info, pimpl_->data.data(), offset)) {
    throw IOError("Failed to initialize font", pimpl_->name);
  }
}

TrueTypeFace::~TrueTypeFace() = default;

std::string TrueTypeFace::name() const { return pimpl_->name; }

FontMetrics TrueTypeFace::metrics(float pixel_height) const {
  int ascent = 0, descent = 0, line_gap = 0;
  stbtt_GetFontVMetrics(&pimpl_->info, &ascent, &descent, &line_gap);
  float scale = pimpl_->scale(pixel_height);

  FontMetrics m;
  m.ascent = ascent * scale;
  m.descent = -descent * scale;
  m.line_gap = line_gap * scale;
  return m;
}

float TrueTypeFace::advance(char32_t codepoint, float pixel_height) const {
  int advance = 0, lsb = 0;
  stbtt_GetCodepointHMetrics(&pimpl_->info, static_cast<int>(codepoint),
                             &advance, &lsb);
  return advance * pimpl_->scale(pixel_height);
}

float TrueTypeFace::kerning(char32_t left, char32_t right,
                            float pixel_height) const {
  return stbtt_GetCodepointKernAdvance(&pimpl_->info, static_cast<int>(left),
                                       static_cast<int>(right)) *
         pimpl_->scale(pixel_height);
}

GlyphBitmap TrueTypeFace::rasterize(char32_t codepoint,
                                    float pixel_height) const {
  float scale = pimpl_->scale(pixel_height);
  int c = static_cast<int>(codepoint);

  GlyphBitmap glyph;
  int x1 = 0, y1 = 0;
  stbtt_GetCodepointBitmapBox(&pimpl_->info, c, scale, scale, &glyph.x0,
                              &glyph.y0, &x1, &y1);
  glyph.width = x1 - glyph.x0;
  glyph.height = y1 - glyph.y0;

  if (glyph.empty()) {
    return glyph;
  }
  glyph.coverage.resize(static_cast<size_t>(glyph.width) * glyph.height);
  stbtt_MakeCodepointBitmap(&pimpl_->info, glyph.coverage.data(), glyph.width,
                            glyph.height, glyph.width, scale, scale, c);
  return glyph;
}

// ============================================================================
// BlockFace
// ============================================================================

FontMetrics BlockFace::metrics(float pixel_height) const {
  FontMetrics m;
  m.ascent = pixel_height * 0.8f;
  m.descent = pixel_height * 0.2f;
  return m;
}

float BlockFace::advance(char32_t /*codepoint*/, float pixel_height) const {
  return std::round(pixel_height * 0.6f);
}

GlyphBitmap BlockFace::rasterize(char32_t codepoint, float pixel_height) const {
  GlyphBitmap glyph;
  if (codepoint == U' ' || codepoint == U'\t') {
    return glyph;
  }
  glyph.width = std::max(1, static_cast<int>(std::round(pixel_height * 0.5f)));
  glyph.height = std::max(1, static_cast<int>(std::round(pixel_height * 0.7f)));
  glyph.x0 = 0;
  glyph.y0 = -glyph.height;
  glyph.coverage.assign(static_cast<size_t>(glyph.width) * glyph.height, 255);
  return glyph;
}

// ============================================================================
// FontLibrary
// ============================================================================

FontLibrary::FontLibrary(std::vector<std::filesystem::path> search_dirs,
                         bool verbose)
    : search_dirs_(std::move(search_dirs)), verbose_(verbose) {}

FontLibrary::~FontLibrary() = default;

std::filesystem::path FontLibrary::resolve_path(const std::string &font) const {
  std::error_code ec;
  std::filesystem::path direct(font);
  if (!font.empty() && std::filesystem::is_regular_file(direct, ec)) {
    return direct;
  }

  for (const auto &dir : search_dirs_) {
    for (const char *suffix : {"", ".ttf", ".otf"}) {
      std::filesystem::path candidate = dir / (font + suffix);
      if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
      }
    }
  }
  throw IOError("Font not found", font);
}

const FontFace &FontLibrary::face(const std::string &font) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = faces_.find(font);
  if (it != faces_.end()) {
    return *it->second;
  }

  std::unique_ptr<FontFace> loaded;
  if (font == BlockFace::NAME) {
    loaded = std::make_unique<BlockFace>();
  } else {
    std::filesystem::path path = resolve_path(font);
    if (verbose_) {
      std::cout << "🔤 Loading font '" << font << "' from " << path.string()
                << std::endl;
    }
    loaded = TrueTypeFace::from_file(path);
  }

  const FontFace &ref = *loaded;
  faces_.emplace(font, std::move(loaded));
  return ref;
}

void FontLibrary::prepare(const Template &tmpl) {
  for (const auto &tt : tmpl.text_templates()) {
    (void)face(tt.font);
  }
}

void FontLibrary::add_face(const std::string &font,
                           std::unique_ptr<FontFace> face) {
  std::lock_guard<std::mutex> lock(mutex_);
  faces_[font] = std::move(face);
}

} // namespace MemeEngine::Text
