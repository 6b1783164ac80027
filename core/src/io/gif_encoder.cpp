/**
 * @file gif_encoder.cpp
 * @brief GIF89a encoder: median-cut palettes and LZW compression
 *
 * Every frame is written whole with its own local color table, so frame
 * order, size and timing carry over exactly from the Animation.
 */

#include "core/errors.hpp"
#include "io/gif.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_map>

namespace MemeEngine::IO {

namespace {

constexpr uint8_t ALPHA_THRESHOLD = 128;
constexpr int MAX_LZW_CODES = 4096;

using RGB = std::array<uint8_t, 3>;

uint32_t pack(RGB c) {
  return (static_cast<uint32_t>(c[0]) << 16) |
         (static_cast<uint32_t>(c[1]) << 8) | c[2];
}

RGB unpack(uint32_t v) {
  return {static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8),
          static_cast<uint8_t>(v)};
}

struct ColorCount {
  uint32_t color;
  uint32_t count;
};

/// Box of histogram entries [begin, end) for median cut
struct ColorBox {
  size_t begin;
  size_t end;
  int channel = 0;
  int range = 0;
};

void measure_box(const std::vector<ColorCount> &colors, ColorBox &box) {
  std::array<int, 3> lo{255, 255, 255};
  std::array<int, 3> hi{0, 0, 0};
  for (size_t i = box.begin; i < box.end; ++i) {
    RGB c = unpack(colors[i].color);
    for (int ch = 0; ch < 3; ++ch) {
      lo[ch] = std::min<int>(lo[ch], c[ch]);
      hi[ch] = std::max<int>(hi[ch], c[ch]);
    }
  }
  box.range = -1;
  for (int ch = 0; ch < 3; ++ch) {
    if (hi[ch] - lo[ch] > box.range) {
      box.range = hi[ch] - lo[ch];
      box.channel = ch;
    }
  }
}

RGB box_average(const std::vector<ColorCount> &colors, const ColorBox &box) {
  uint64_t sum[3] = {0, 0, 0};
  uint64_t total = 0;
  for (size_t i = box.begin; i < box.end; ++i) {
    RGB c = unpack(colors[i].color);
    for (int ch = 0; ch < 3; ++ch) {
      sum[ch] += static_cast<uint64_t>(c[ch]) * colors[i].count;
    }
    total += colors[i].count;
  }
  RGB out{};
  for (int ch = 0; ch < 3; ++ch) {
    out[ch] = static_cast<uint8_t>((sum[ch] + total / 2) / total);
  }
  return out;
}

std::vector<RGB> median_cut(std::vector<ColorCount> colors, size_t max_colors) {
  std::vector<ColorBox> boxes;
  ColorBox all{0, colors.size()};
  measure_box(colors, all);
  boxes.push_back(all);

  while (boxes.size() < max_colors) {
    // Split the box with the widest channel range
    auto widest = std::max_element(
        boxes.begin(), boxes.end(),
        [](const ColorBox &a, const ColorBox &b) { return a.range < b.range; });
    if (widest->range <= 0 || widest->end - widest->begin < 2) {
      break;
    }

    ColorBox box = *widest;
    const int ch = box.channel;
    std::sort(colors.begin() + box.begin, colors.begin() + box.end,
              [ch](const ColorCount &a, const ColorCount &b) {
                uint8_t va = unpack(a.color)[ch];
                uint8_t vb = unpack(b.color)[ch];
                return va != vb ? va < vb : a.color < b.color;
              });

    uint64_t total = 0;
    for (size_t i = box.begin; i < box.end; ++i)
      total += colors[i].count;

    // Weighted median, keeping both halves non-empty
    uint64_t acc = 0;
    size_t split = box.begin + 1;
    for (size_t i = box.begin; i < box.end - 1; ++i) {
      acc += colors[i].count;
      split = i + 1;
      if (acc * 2 >= total)
        break;
    }

    ColorBox left{box.begin, split};
    ColorBox right{split, box.end};
    measure_box(colors, left);
    measure_box(colors, right);
    *widest = left;
    boxes.push_back(right);
  }

  std::vector<RGB> palette;
  palette.reserve(boxes.size());
  for (const auto &box : boxes) {
    palette.push_back(box_average(colors, box));
  }
  return palette;
}

uint8_t nearest(const std::vector<RGB> &palette, RGB c, size_t limit) {
  uint8_t best = 0;
  int best_dist = INT32_MAX;
  for (size_t i = 0; i < limit; ++i) {
    int dr = int(palette[i][0]) - c[0];
    int dg = int(palette[i][1]) - c[1];
    int db = int(palette[i][2]) - c[2];
    int dist = dr * dr + dg * dg + db * db;
    if (dist < best_dist) {
      best_dist = dist;
      best = static_cast<uint8_t>(i);
    }
  }
  return best;
}

/// LSB-first bit packer emitting 255-byte GIF sub-blocks later
class BitWriter {
public:
  void write(uint32_t code, int bits) {
    buffer_ |= code << filled_;
    filled_ += bits;
    while (filled_ >= 8) {
      bytes_.push_back(static_cast<uint8_t>(buffer_ & 0xFF));
      buffer_ >>= 8;
      filled_ -= 8;
    }
  }

  std::vector<uint8_t> finish() {
    if (filled_ > 0) {
      bytes_.push_back(static_cast<uint8_t>(buffer_ & 0xFF));
    }
    buffer_ = 0;
    filled_ = 0;
    return std::move(bytes_);
  }

private:
  std::vector<uint8_t> bytes_;
  uint32_t buffer_ = 0;
  int filled_ = 0;
};

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

int table_bits(size_t colors) {
  int bits = 1;
  while ((size_t{1} << bits) < colors)
    ++bits;
  return bits;
}

} // anonymous namespace

IndexedFrame quantize(const ImageBuffer &image) {
  const size_t pixel_count = static_cast<size_t>(image.width) * image.height;

  std::unordered_map<uint32_t, uint32_t> histogram;
  bool has_transparency = false;
  for (size_t i = 0; i < pixel_count; ++i) {
    const uint8_t *p = &image.data[i * 4];
    if (p[3] < ALPHA_THRESHOLD) {
      has_transparency = true;
      continue;
    }
    ++histogram[pack({p[0], p[1], p[2]})];
  }

  std::vector<ColorCount> colors;
  colors.reserve(histogram.size());
  for (const auto &[color, count] : histogram) {
    colors.push_back({color, count});
  }
  // Hash map order is unspecified; sort for a deterministic palette
  std::sort(colors.begin(), colors.end(),
            [](const ColorCount &a, const ColorCount &b) {
              return a.color < b.color;
            });

  const size_t max_colors = has_transparency ? 255 : 256;

  IndexedFrame frame;
  if (colors.empty()) {
    frame.palette.push_back({0, 0, 0});
  } else if (colors.size() <= max_colors) {
    for (const auto &c : colors)
      frame.palette.push_back(unpack(c.color));
  } else {
    frame.palette = median_cut(std::move(colors), max_colors);
  }

  const size_t opaque_entries = frame.palette.size();
  if (has_transparency) {
    frame.transparent_index = static_cast<int>(opaque_entries);
    frame.palette.push_back({0, 0, 0});
  }

  std::unordered_map<uint32_t, uint8_t> lookup;
  frame.indices.resize(pixel_count);
  for (size_t i = 0; i < pixel_count; ++i) {
    const uint8_t *p = &image.data[i * 4];
    if (p[3] < ALPHA_THRESHOLD) {
      frame.indices[i] = static_cast<uint8_t>(frame.transparent_index);
      continue;
    }
    RGB c{p[0], p[1], p[2]};
    auto [it, inserted] = lookup.try_emplace(pack(c), 0);
    if (inserted) {
      it->second = nearest(frame.palette, c, opaque_entries);
    }
    frame.indices[i] = it->second;
  }

  return frame;
}

std::vector<uint8_t> lzw_compress(std::span<const uint8_t> indices,
                                  int min_code_size) {
  const uint32_t clear_code = 1u << min_code_size;
  const uint32_t end_code = clear_code + 1;

  BitWriter writer;
  std::unordered_map<uint32_t, uint32_t> dictionary;
  uint32_t next_code = end_code + 1;
  int code_size = min_code_size + 1;

  writer.write(clear_code, code_size);
  if (indices.empty()) {
    writer.write(end_code, code_size);
    return writer.finish();
  }

  uint32_t prefix = indices[0];
  for (size_t i = 1; i < indices.size(); ++i) {
    const uint8_t k = indices[i];
    const uint32_t key = (prefix << 8) | k;
    auto it = dictionary.find(key);
    if (it != dictionary.end()) {
      prefix = it->second;
      continue;
    }

    writer.write(prefix, code_size);
    if (next_code < MAX_LZW_CODES) {
      // The decoder widens codes as soon as next_code reaches 2^code_size
      if (next_code == (1u << code_size) && code_size < 12) {
        ++code_size;
      }
      dictionary.emplace(key, next_code++);
    } else {
      writer.write(clear_code, code_size);
      dictionary.clear();
      next_code = end_code + 1;
      code_size = min_code_size + 1;
    }
    prefix = k;
  }

  writer.write(prefix, code_size);
  writer.write(end_code, code_size);
  return writer.finish();
}

std::vector<uint8_t> encode_gif(const Animation &animation) {
  if (animation.empty()) {
    throw ValidationError("Cannot encode an animation without frames");
  }

  std::vector<uint8_t> out;
  const char header[] = "GIF89a";
  out.insert(out.end(), header, header + 6);

  // Logical screen descriptor, no global color table
  put_u16(out, static_cast<uint16_t>(animation.width));
  put_u16(out, static_cast<uint16_t>(animation.height));
  out.push_back(0x00);
  out.push_back(0x00); // background color index
  out.push_back(0x00); // pixel aspect ratio

  if (animation.loop_count) {
    const char app[] = "NETSCAPE2.0";
    out.push_back(0x21);
    out.push_back(0xFF);
    out.push_back(0x0B);
    out.insert(out.end(), app, app + 11);
    out.push_back(0x03);
    out.push_back(0x01);
    put_u16(out, *animation.loop_count);
    out.push_back(0x00);
  }

  for (const auto &frame : animation.frames) {
    IndexedFrame indexed = quantize(frame.image);
    const int bits = table_bits(indexed.palette.size());
    const bool transparent = indexed.transparent_index >= 0;

    // Graphic control extension: disposal, delay, transparency
    const uint32_t centis = std::min<uint32_t>((frame.duration_ms + 5) / 10, 0xFFFF);
    out.push_back(0x21);
    out.push_back(0xF9);
    out.push_back(0x04);
    out.push_back(transparent ? ((2 << 2) | 0x01) : (1 << 2));
    put_u16(out, static_cast<uint16_t>(centis));
    out.push_back(transparent ? static_cast<uint8_t>(indexed.transparent_index)
                              : 0x00);
    out.push_back(0x00);

    // Image descriptor with local color table
    out.push_back(0x2C);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(frame.image.width));
    put_u16(out, static_cast<uint16_t>(frame.image.height));
    out.push_back(static_cast<uint8_t>(0x80 | (bits - 1)));

    for (size_t i = 0; i < (size_t{1} << bits); ++i) {
      if (i < indexed.palette.size()) {
        out.insert(out.end(), indexed.palette[i].begin(),
                   indexed.palette[i].end());
      } else {
        out.insert(out.end(), {0, 0, 0});
      }
    }

    const int min_code_size = std::max(2, bits);
    out.push_back(static_cast<uint8_t>(min_code_size));
    std::vector<uint8_t> data = lzw_compress(indexed.indices, min_code_size);
    for (size_t pos = 0; pos < data.size(); pos += 255) {
      size_t n = std::min<size_t>(255, data.size() - pos);
      out.push_back(static_cast<uint8_t>(n));
      out.insert(out.end(), data.begin() + pos, data.begin() + pos + n);
    }
    out.push_back(0x00);
  }

  out.push_back(0x3B);
  return out;
}

void save_gif(const Animation &animation, const std::filesystem::path &path) {
  std::vector<uint8_t> bytes = encode_gif(animation);

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw IOError("Cannot write output", path.string());
  }
  file.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  file.flush();
  if (!file) {
    throw IOError("Failed to write output", path.string());
  }
}

} // namespace MemeEngine::IO
