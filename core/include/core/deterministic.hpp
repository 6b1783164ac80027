#pragma once
/**
 * @file deterministic.hpp
 * @brief Frame hashing for determinism checks
 *
 * FNV-1a hashes over pixel data and frame metadata. Used by the consistency
 * runner and by tests comparing parallel and sequential renders.
 */

#include <cstdint>
#include <span>

namespace MemeEngine::Deterministic {

inline constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
inline constexpr uint64_t FNV_PRIME = 1099511628211ULL;

/**
 * @brief FNV-1a 64-bit hash
 */
[[nodiscard]] inline uint64_t
compute_pixel_hash(std::span<const uint8_t> pixels) noexcept {
  uint64_t hash = FNV_OFFSET;
  for (uint8_t byte : pixels) {
    hash ^= byte;
    hash *= FNV_PRIME;
  }
  return hash;
}

/**
 * @brief Hash a sequence of 32-bit values (dimensions, durations)
 */
[[nodiscard]] inline uint64_t
hash_values(std::span<const uint32_t> values) noexcept {
  uint64_t hash = FNV_OFFSET;
  for (uint32_t v : values) {
    for (int shift = 0; shift < 32; shift += 8) {
      hash ^= (v >> shift) & 0xFF;
      hash *= FNV_PRIME;
    }
  }
  return hash;
}

/**
 * @brief Combine multiple hashes
 */
[[nodiscard]] constexpr uint64_t combine_hashes(uint64_t h1,
                                                uint64_t h2) noexcept {
  return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

} // namespace MemeEngine::Deterministic
