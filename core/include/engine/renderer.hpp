#pragma once
/**
 * @file renderer.hpp
 * @brief RGBA pixel buffer shared by the codec, compositor and assembler
 */

#include <cstdint>
#include <vector>

namespace MemeEngine {

/// RGBA image buffer
struct ImageBuffer {
  std::vector<uint8_t> data;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t channels = 4; // RGBA

  /// Create empty (transparent) buffer with dimensions
  static ImageBuffer create(uint32_t w, uint32_t h);

  /// Get pixel at (x, y), nullptr when out of bounds
  [[nodiscard]] uint8_t *pixel(uint32_t x, uint32_t y);
  [[nodiscard]] const uint8_t *pixel(uint32_t x, uint32_t y) const;

  /// Fill with color
  void fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

  [[nodiscard]] bool operator==(const ImageBuffer &) const = default;
};

} // namespace MemeEngine
