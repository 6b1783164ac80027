/**
 * @file interpolation.cpp
 * @brief Linear keyframe interpolation with boundary hold
 */

#include "engine/interpolation.hpp"

#include <glm/glm.hpp>

namespace MemeEngine {

namespace {

const std::optional<double> &field_of(const KeyframeEntry &entry,
                                      KeyframeField field) {
  switch (field) {
  case KeyframeField::X:
    return entry.x;
  case KeyframeField::Y:
    return entry.y;
  case KeyframeField::FontSize:
  default:
    return entry.font_size;
  }
}

} // anonymous namespace

std::optional<double> resolve_field(const TextTemplate &tt, KeyframeField field,
                                    uint32_t frame) {
  // Nearest keyframes at or before / after the frame that set this field
  const std::pair<const uint32_t, KeyframeEntry> *before = nullptr;
  const std::pair<const uint32_t, KeyframeEntry> *after = nullptr;

  for (const auto &kf : tt.keyframes) {
    if (!field_of(kf.second, field)) {
      continue;
    }
    if (kf.first <= frame) {
      before = &kf;
    } else {
      after = &kf;
      break; // map is ordered, the first later key is the nearest
    }
  }

  if (!before && !after) {
    return std::nullopt;
  }
  if (!after) {
    return field_of(before->second, field); // at or past the last keyframe
  }
  if (!before) {
    return field_of(after->second, field); // before the first keyframe
  }
  if (before->first == frame) {
    return field_of(before->second, field);
  }

  const double v0 = *field_of(before->second, field);
  const double v1 = *field_of(after->second, field);
  const double t = static_cast<double>(frame - before->first) /
                   static_cast<double>(after->first - before->first);
  return glm::mix(v0, v1, t);
}

ResolvedProperties resolve(const TextTemplate &tt, uint32_t frame,
                           const InterpolationDefaults &defaults) {
  ResolvedProperties props;
  props.x = resolve_field(tt, KeyframeField::X, frame).value_or(tt.origin.x);
  props.y = resolve_field(tt, KeyframeField::Y, frame).value_or(tt.origin.y);
  props.font_size = resolve_field(tt, KeyframeField::FontSize, frame)
                        .value_or(defaults.font_size);
  return props;
}

std::vector<ResolvedProperties> resolve_all(const Template &tmpl,
                                            uint32_t frame,
                                            const InterpolationDefaults &defaults) {
  std::vector<ResolvedProperties> out;
  out.reserve(tmpl.size());
  for (const auto &tt : tmpl.text_templates()) {
    out.push_back(resolve(tt, frame, defaults));
  }
  return out;
}

} // namespace MemeEngine
