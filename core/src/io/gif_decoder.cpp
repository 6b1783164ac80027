/**
 * @file gif_decoder.cpp
 * @brief Animated GIF decoding with stb_image
 */

#include "core/errors.hpp"
#include "io/gif.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_GIF
#include <stb/stb_image.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>

namespace MemeEngine::IO {

namespace {

struct StbiFree {
  void operator()(void *p) const { stbi_image_free(p); }
};

bool has_gif_signature(std::span<const uint8_t> bytes) {
  return bytes.size() >= 6 &&
         (std::memcmp(bytes.data(), "GIF87a", 6) == 0 ||
          std::memcmp(bytes.data(), "GIF89a", 6) == 0);
}

/// Repeat count from the NETSCAPE2.0 application extension, if present
std::optional<uint16_t> find_loop_count(std::span<const uint8_t> bytes) {
  static constexpr uint8_t marker[] = {0x21, 0xFF, 0x0B, 'N', 'E', 'T', 'S',
                                       'C',  'A',  'P',  'E', '2', '.', '0'};
  auto it = std::search(bytes.begin(), bytes.end(), std::begin(marker),
                        std::end(marker));
  if (it == bytes.end()) {
    return std::nullopt;
  }
  size_t pos = static_cast<size_t>(it - bytes.begin()) + sizeof(marker);
  // Sub-block: size 3, id 1, little-endian count
  if (pos + 4 > bytes.size() || bytes[pos] != 0x03 || bytes[pos + 1] != 0x01) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(bytes[pos + 2] | (bytes[pos + 3] << 8));
}

} // anonymous namespace

std::vector<uint8_t> read_file_bytes(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw IOError("Cannot open file", path.string());
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw IOError("Failed to read file", path.string());
  }
  return data;
}

Animation decode_gif(std::span<const uint8_t> bytes, const std::string &source) {
  if (!has_gif_signature(bytes)) {
    throw IOError("Not a GIF file", source);
  }

  int *delays = nullptr;
  int width = 0, height = 0, frame_count = 0, channels = 0;
  stbi_uc *pixels = stbi_load_gif_from_memory(
      bytes.data(), static_cast<int>(bytes.size()), &delays, &width, &height,
      &frame_count, &channels, 4);

  if (!pixels) {
    const char *reason = stbi_failure_reason();
    throw IOError(std::string("Failed to decode GIF (") +
                      (reason ? reason : "no frames") + ")",
                  source);
  }

  std::unique_ptr<stbi_uc, StbiFree> pixel_guard(pixels);
  std::unique_ptr<int, StbiFree> delay_guard(delays);

  Animation anim;
  const size_t frame_bytes = static_cast<size_t>(width) * height * 4;
  for (int i = 0; i < frame_count; ++i) {
    Frame frame;
    frame.image = ImageBuffer::create(static_cast<uint32_t>(width),
                                      static_cast<uint32_t>(height));
    std::memcpy(frame.image.data.data(), pixels + frame_bytes * i,
                frame_bytes);
    // stb_image reports delays in milliseconds
    frame.duration_ms =
        delays ? static_cast<uint32_t>(std::max(delays[i], 0)) : 0;
    anim.append(std::move(frame));
  }

  if (anim.empty()) {
    throw IOError("GIF contains no frames", source);
  }
  anim.loop_count = find_loop_count(bytes);
  return anim;
}

Animation load_gif(const std::filesystem::path &path) {
  std::vector<uint8_t> bytes = read_file_bytes(path);
  return decode_gif(bytes, path.string());
}

} // namespace MemeEngine::IO
