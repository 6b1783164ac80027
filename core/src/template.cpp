/**
 * @file template.cpp
 * @brief Template model: editing and invariant checks
 */

#include "engine/template.hpp"
#include "core/errors.hpp"
#include "engine/animation.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace MemeEngine {

namespace {

void check_finite(const std::optional<double> &value, const char *field,
                  const TextTemplate &tt, uint32_t frame) {
  if (value && !std::isfinite(*value)) {
    throw ValidationError("Text template '" + tt.id + "': keyframe " +
                          std::to_string(frame) + " has non-finite " + field);
  }
}

} // anonymous namespace

void KeyframeEntry::merge(const KeyframeEntry &other) {
  if (other.x)
    x = other.x;
  if (other.y)
    y = other.y;
  if (other.font_size)
    font_size = other.font_size;
}

std::vector<std::pair<uint32_t, KeyframeEntry>>
TextTemplate::ordered_keyframes() const {
  // std::map already iterates in ascending frame order
  return {keyframes.begin(), keyframes.end()};
}

Template::Template(BaseAnimationInfo animation,
                   std::vector<TextTemplate> text_templates)
    : animation_(animation), text_templates_(std::move(text_templates)) {}

const TextTemplate *Template::find(const std::string &id) const {
  auto it = std::find_if(text_templates_.begin(), text_templates_.end(),
                         [&](const TextTemplate &t) { return t.id == id; });
  return it != text_templates_.end() ? &*it : nullptr;
}

TextTemplate *Template::find_mutable(const std::string &id) {
  return const_cast<TextTemplate *>(std::as_const(*this).find(id));
}

void Template::add_text_template(TextTemplate text_template) {
  if (text_template.id.empty()) {
    throw ValidationError("Text template id must not be empty");
  }
  if (find(text_template.id)) {
    throw ValidationError("Duplicate text template id: " + text_template.id);
  }
  text_templates_.push_back(std::move(text_template));
}

bool Template::remove_text_template(const std::string &id) {
  auto it = std::find_if(text_templates_.begin(), text_templates_.end(),
                         [&](const TextTemplate &t) { return t.id == id; });
  if (it == text_templates_.end()) {
    return false;
  }
  text_templates_.erase(it);
  return true;
}

void Template::insert_keyframe(const std::string &id, uint32_t frame,
                               const KeyframeEntry &entry) {
  TextTemplate *tt = find_mutable(id);
  if (!tt) {
    throw ValidationError("Unknown text template id: " + id);
  }
  if (frame >= animation_.frame_count) {
    throw ValidationError("Keyframe " + std::to_string(frame) +
                          " is outside the animation (" +
                          std::to_string(animation_.frame_count) + " frames)");
  }
  tt->keyframes[frame].merge(entry);
}

bool Template::remove_keyframe(const std::string &id, uint32_t frame) {
  TextTemplate *tt = find_mutable(id);
  return tt && tt->keyframes.erase(frame) > 0;
}

void Template::validate() const {
  if (animation_.frame_count == 0) {
    throw ValidationError("Template frame_count must be at least 1");
  }

  std::unordered_set<std::string> ids;
  for (const auto &tt : text_templates_) {
    if (tt.id.empty()) {
      throw ValidationError("Text template id must not be empty");
    }
    if (!ids.insert(tt.id).second) {
      throw ValidationError("Duplicate text template id: " + tt.id);
    }
    if (!std::isfinite(tt.origin.x) || !std::isfinite(tt.origin.y)) {
      throw ValidationError("Text template '" + tt.id +
                            "': origin must be finite");
    }
    if (!(tt.stroke_width >= 0.0f && tt.stroke_width <= MAX_STROKE_WIDTH)) {
      throw ValidationError("Text template '" + tt.id +
                            "': stroke_width must be in [0, 1024]");
    }

    for (const auto &[frame, entry] : tt.keyframes) {
      if (frame >= animation_.frame_count) {
        throw ValidationError("Text template '" + tt.id + "': keyframe " +
                              std::to_string(frame) +
                              " is outside [0, " +
                              std::to_string(animation_.frame_count - 1) + "]");
      }
      check_finite(entry.x, "x", tt, frame);
      check_finite(entry.y, "y", tt, frame);
      check_finite(entry.font_size, "font_size", tt, frame);
      if (entry.font_size && *entry.font_size <= 0.0) {
        throw ValidationError("Text template '" + tt.id + "': keyframe " +
                              std::to_string(frame) +
                              " has non-positive font_size");
      }
    }
  }
}

void Template::validate_against(const Animation &base) const {
  validate();
  if (base.frame_count() != animation_.frame_count) {
    throw ValidationError("Template expects " +
                          std::to_string(animation_.frame_count) +
                          " frames but the animation has " +
                          std::to_string(base.frame_count()));
  }
  if ((animation_.width && *animation_.width != base.width) ||
      (animation_.height && *animation_.height != base.height)) {
    throw ValidationError(
        "Template was designed for " +
        std::to_string(animation_.width.value_or(base.width)) + "x" +
        std::to_string(animation_.height.value_or(base.height)) +
        " but the animation is " + std::to_string(base.width) + "x" +
        std::to_string(base.height));
  }
}

std::optional<TextAlign> parse_text_align(const std::string &name) {
  if (name == "left")
    return TextAlign::Left;
  if (name == "center")
    return TextAlign::Center;
  if (name == "right")
    return TextAlign::Right;
  return std::nullopt;
}

const char *to_string(TextAlign align) noexcept {
  switch (align) {
  case TextAlign::Left:
    return "left";
  case TextAlign::Right:
    return "right";
  case TextAlign::Center:
  default:
    return "center";
  }
}

} // namespace MemeEngine
