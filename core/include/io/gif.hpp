#pragma once
/**
 * @file gif.hpp
 * @brief Animated GIF decoding (stb_image) and encoding (GIF89a)
 */

#include "engine/animation.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace MemeEngine::IO {

/// Decode a GIF held in memory; throws IOError when it is not a valid GIF
[[nodiscard]] Animation decode_gif(std::span<const uint8_t> bytes,
                                   const std::string &source = "<memory>");

/// Read and decode a GIF file; throws IOError
[[nodiscard]] Animation load_gif(const std::filesystem::path &path);

/// Encode frames, durations and loop count as GIF89a
[[nodiscard]] std::vector<uint8_t> encode_gif(const Animation &animation);

/// Encode and write a GIF file; throws IOError when unwritable
void save_gif(const Animation &animation, const std::filesystem::path &path);

/// Read a whole file; throws IOError
[[nodiscard]] std::vector<uint8_t>
read_file_bytes(const std::filesystem::path &path);

/**
 * @brief Palette of one encoded frame
 *
 * Exposed for tests; `indices` maps every pixel to a palette entry.
 */
struct IndexedFrame {
  std::vector<std::array<uint8_t, 3>> palette;
  std::vector<uint8_t> indices;
  int transparent_index = -1; ///< -1 when the frame is fully opaque
};

/// Reduce an RGBA frame to at most 256 colors (median cut)
[[nodiscard]] IndexedFrame quantize(const ImageBuffer &image);

/// GIF LZW compression of palette indices
[[nodiscard]] std::vector<uint8_t> lzw_compress(std::span<const uint8_t> indices,
                                                int min_code_size);

} // namespace MemeEngine::IO
