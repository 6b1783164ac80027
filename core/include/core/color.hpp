#pragma once
/**
 * @file color.hpp
 * @brief Header-only color utilities
 *
 * Provides RGBA colors, hex parsing, and the blending used when text is
 * composited onto animation frames.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MemeEngine::Color {

// ============================================================================
// RGBA Color Structure
// ============================================================================

/**
 * @brief RGBA color with 8-bit components
 *
 * Memory layout is R, G, B, A (matches ImageBuffer pixels)
 */
struct RGBA {
  uint8_t r, g, b, a;

  /// Default constructor (white, opaque)
  constexpr RGBA() noexcept : r(255), g(255), b(255), a(255) {}

  /// Component constructor
  constexpr RGBA(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) noexcept
      : r(r_), g(g_), b(b_), a(a_) {}

  /// Pack to 32-bit value (RGBA format)
  [[nodiscard]] constexpr uint32_t to_packed_rgba() const noexcept {
    return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
           (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
  }

  [[nodiscard]] constexpr bool operator==(const RGBA &other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  [[nodiscard]] constexpr bool operator!=(const RGBA &other) const noexcept {
    return !(*this == other);
  }
};

namespace Colors {
constexpr RGBA White{255, 255, 255, 255};
constexpr RGBA Black{0, 0, 0, 255};
constexpr RGBA Transparent{0, 0, 0, 0};
} // namespace Colors

// ============================================================================
// Hex Color Parsing
// ============================================================================

/**
 * @brief Parse hex color string
 * @param hex Color string (#RGB, #RGBA, #RRGGBB, #RRGGBBAA)
 * @return Parsed RGBA color, or nullopt if the string is not a hex color
 */
[[nodiscard]] inline std::optional<RGBA> parse_hex(std::string_view hex) noexcept {
  if (!hex.empty() && hex[0] == '#') {
    hex.remove_prefix(1);
  }
  if (hex.empty()) {
    return std::nullopt;
  }

  uint32_t val = 0;
  for (char c : hex) {
    val *= 16;
    if (c >= '0' && c <= '9') {
      val += c - '0';
    } else if (c >= 'a' && c <= 'f') {
      val += c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      val += c - 'A' + 10;
    } else {
      return std::nullopt;
    }
  }

  switch (hex.size()) {
  case 3: // #RGB -> #RRGGBB
    return RGBA{static_cast<uint8_t>(((val >> 8) & 0xF) * 17),
                static_cast<uint8_t>(((val >> 4) & 0xF) * 17),
                static_cast<uint8_t>((val & 0xF) * 17), 255};

  case 4: // #RGBA -> #RRGGBBAA
    return RGBA{static_cast<uint8_t>(((val >> 12) & 0xF) * 17),
                static_cast<uint8_t>(((val >> 8) & 0xF) * 17),
                static_cast<uint8_t>(((val >> 4) & 0xF) * 17),
                static_cast<uint8_t>((val & 0xF) * 17)};

  case 6: // #RRGGBB
    return RGBA{static_cast<uint8_t>((val >> 16) & 0xFF),
                static_cast<uint8_t>((val >> 8) & 0xFF),
                static_cast<uint8_t>(val & 0xFF), 255};

  case 8: // #RRGGBBAA
    return RGBA{static_cast<uint8_t>((val >> 24) & 0xFF),
                static_cast<uint8_t>((val >> 16) & 0xFF),
                static_cast<uint8_t>((val >> 8) & 0xFF),
                static_cast<uint8_t>(val & 0xFF)};

  default:
    return std::nullopt;
  }
}

// ============================================================================
// Color Blending
// ============================================================================

/**
 * @brief Blend a color with partial coverage onto an RGBA pixel in place
 * @param dst Pointer to 4 bytes (R, G, B, A)
 * @param c Source color
 * @param coverage Glyph coverage 0-255, multiplied with c.a
 */
inline void blend_onto(uint8_t *dst, RGBA c, uint8_t coverage) noexcept {
  const uint32_t a = (static_cast<uint32_t>(c.a) * coverage + 127) / 255;
  if (a == 0) {
    return;
  }
  if (a == 255) {
    dst[0] = c.r;
    dst[1] = c.g;
    dst[2] = c.b;
    dst[3] = 255;
    return;
  }

  // Integer arithmetic keeps output bit-identical across threads and builds
  const uint32_t inv = 255 - a;
  dst[0] = static_cast<uint8_t>((c.r * a + dst[0] * inv + 127) / 255);
  dst[1] = static_cast<uint8_t>((c.g * a + dst[1] * inv + 127) / 255);
  dst[2] = static_cast<uint8_t>((c.b * a + dst[2] * inv + 127) / 255);
  dst[3] = static_cast<uint8_t>(a + (dst[3] * inv + 127) / 255);
}

/// Format as #RRGGBB or #RRGGBBAA (alpha omitted when opaque)
[[nodiscard]] inline std::string to_hex(RGBA c) {
  static constexpr char digits[] = "0123456789ABCDEF";
  std::string out = "#";
  auto put = [&](uint8_t v) {
    out += digits[v >> 4];
    out += digits[v & 0xF];
  };
  put(c.r);
  put(c.g);
  put(c.b);
  if (c.a != 255) {
    put(c.a);
  }
  return out;
}

} // namespace MemeEngine::Color
