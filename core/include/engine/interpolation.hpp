#pragma once
/**
 * @file interpolation.hpp
 * @brief Keyframe interpolation: per-frame position and font size
 *
 * Each animatable field is resolved on its own keyframe track. Between two
 * keyframes that set a field the value moves linearly; before the first
 * and after the last it is held. A frame that carries a set value always
 * yields that exact value.
 */

#include "engine/template.hpp"

#include <cstdint>
#include <vector>

namespace MemeEngine {

/// Values used for a field no keyframe ever sets
struct InterpolationDefaults {
  double font_size = 50.0;
};

/// Concrete drawing properties of one overlay at one frame
struct ResolvedProperties {
  double x = 0.0;
  double y = 0.0;
  double font_size = 0.0;

  [[nodiscard]] bool operator==(const ResolvedProperties &) const = default;
};

/// Animatable field selector
enum class KeyframeField { X, Y, FontSize };

/**
 * @brief Resolve one field of one overlay at @p frame
 * @return The interpolated value, or nullopt when no keyframe sets the field
 */
[[nodiscard]] std::optional<double> resolve_field(const TextTemplate &tt,
                                                  KeyframeField field,
                                                  uint32_t frame);

/**
 * @brief Resolve drawing properties of one overlay at @p frame
 */
[[nodiscard]] ResolvedProperties
resolve(const TextTemplate &tt, uint32_t frame,
        const InterpolationDefaults &defaults = {});

/**
 * @brief Resolve every overlay of a template, in declaration order
 */
[[nodiscard]] std::vector<ResolvedProperties>
resolve_all(const Template &tmpl, uint32_t frame,
            const InterpolationDefaults &defaults = {});

} // namespace MemeEngine
