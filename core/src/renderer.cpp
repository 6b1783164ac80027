/**
 * @file renderer.cpp
 * @brief ImageBuffer and Animation implementation
 */

#include "core/errors.hpp"
#include "engine/animation.hpp"
#include "engine/renderer.hpp"

#include <numeric>

namespace MemeEngine {

// ImageBuffer implementation
ImageBuffer ImageBuffer::create(uint32_t w, uint32_t h) {
  ImageBuffer buf;
  buf.width = w;
  buf.height = h;
  buf.channels = 4;
  buf.data.resize(static_cast<size_t>(w) * h * 4, 0);
  return buf;
}

uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

const uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) const {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

void ImageBuffer::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
  for (size_t i = 0; i < data.size(); i += 4) {
    data[i + 0] = r;
    data[i + 1] = g;
    data[i + 2] = b;
    data[i + 3] = a;
  }
}

// Animation implementation
uint64_t Animation::total_duration_ms() const noexcept {
  return std::accumulate(frames.begin(), frames.end(), uint64_t{0},
                         [](uint64_t sum, const Frame &f) {
                           return sum + f.duration_ms;
                         });
}

void Animation::append(Frame frame) {
  if (frames.empty()) {
    width = frame.image.width;
    height = frame.image.height;
  } else if (frame.image.width != width || frame.image.height != height) {
    throw ValidationError("Frame " + std::to_string(frames.size()) + " is " +
                          std::to_string(frame.image.width) + "x" +
                          std::to_string(frame.image.height) +
                          ", animation is " + std::to_string(width) + "x" +
                          std::to_string(height));
  }
  frames.push_back(std::move(frame));
}

Animation Animation::solid(uint32_t width, uint32_t height, size_t frame_count,
                           uint32_t duration_ms, uint8_t r, uint8_t g,
                           uint8_t b) {
  Animation anim;
  for (size_t i = 0; i < frame_count; ++i) {
    Frame frame;
    frame.image = ImageBuffer::create(width, height);
    frame.image.fill(r, g, b);
    frame.duration_ms = duration_ms;
    anim.append(std::move(frame));
  }
  anim.width = width;
  anim.height = height;
  return anim;
}

} // namespace MemeEngine
