#pragma once
/**
 * @file font.hpp
 * @brief Font faces and the font library used by the compositor
 */

#include "text/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace MemeEngine {
class Template;
}

namespace MemeEngine::Text {

/**
 * @brief Source of glyph metrics and coverage bitmaps
 *
 * Implementations must be safe to query from several threads at once.
 */
class FontFace {
public:
  virtual ~FontFace() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  [[nodiscard]] virtual FontMetrics metrics(float pixel_height) const = 0;

  /// Horizontal advance of @p codepoint in pixels
  [[nodiscard]] virtual float advance(char32_t codepoint,
                                      float pixel_height) const = 0;

  /// Kerning adjustment between two code points in pixels
  [[nodiscard]] virtual float kerning(char32_t left, char32_t right,
                                      float pixel_height) const = 0;

  [[nodiscard]] virtual GlyphBitmap rasterize(char32_t codepoint,
                                              float pixel_height) const = 0;
};

/**
 * @brief TrueType/OpenType face rasterized with stb_truetype
 */
class TrueTypeFace final : public FontFace {
public:
  /// Load a font file; throws IOError when missing or not a font
  static std::unique_ptr<TrueTypeFace> from_file(const std::filesystem::path &path);

  /// Take ownership of font bytes; throws IOError when not a font
  TrueTypeFace(std::string name, std::vector<uint8_t> data);
  ~TrueTypeFace() override;

  TrueTypeFace(const TrueTypeFace &) = delete;
  TrueTypeFace &operator=(const TrueTypeFace &) = delete;

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] FontMetrics metrics(float pixel_height) const override;
  [[nodiscard]] float advance(char32_t codepoint,
                              float pixel_height) const override;
  [[nodiscard]] float kerning(char32_t left, char32_t right,
                              float pixel_height) const override;
  [[nodiscard]] GlyphBitmap rasterize(char32_t codepoint,
                                      float pixel_height) const override;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Built-in face drawing every visible glyph as a solid block
 *
 * Needs no font file. Selected with the font name "block".
 */
class BlockFace final : public FontFace {
public:
  static constexpr const char *NAME = "block";

  [[nodiscard]] std::string name() const override { return NAME; }
  [[nodiscard]] FontMetrics metrics(float pixel_height) const override;
  [[nodiscard]] float advance(char32_t codepoint,
                              float pixel_height) const override;
  [[nodiscard]] float kerning(char32_t, char32_t, float) const override {
    return 0.0f;
  }
  [[nodiscard]] GlyphBitmap rasterize(char32_t codepoint,
                                      float pixel_height) const override;
};

/**
 * @brief Resolves template font references to loaded faces
 *
 * A reference is the built-in "block", a path to a font file, or a name
 * looked up as `<name>`, `<name>.ttf` or `<name>.otf` in the search
 * directories. Faces are loaded once and live as long as the library.
 */
class FontLibrary {
public:
  explicit FontLibrary(std::vector<std::filesystem::path> search_dirs = {},
                       bool verbose = false);
  ~FontLibrary();

  FontLibrary(const FontLibrary &) = delete;
  FontLibrary &operator=(const FontLibrary &) = delete;

  /// Face for a font reference, loading it on first use; throws IOError
  [[nodiscard]] const FontFace &face(const std::string &font);

  /// Load every font a template references
  void prepare(const Template &tmpl);

  /// Register a face under a name; not to be called while a render runs
  void add_face(const std::string &font, std::unique_ptr<FontFace> face);

  /// File a font reference resolves to; throws IOError when not found
  [[nodiscard]] std::filesystem::path
  resolve_path(const std::string &font) const;

  [[nodiscard]] const std::vector<std::filesystem::path> &
  search_dirs() const noexcept {
    return search_dirs_;
  }

private:
  std::vector<std::filesystem::path> search_dirs_;
  bool verbose_;
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<FontFace>> faces_;
};

} // namespace MemeEngine::Text
