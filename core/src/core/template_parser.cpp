/**
 * @file template_parser.cpp
 * @brief JSON template parser and serializer
 */

#include "core/color.hpp"
#include "core/errors.hpp"
#include "engine/template.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <functional>
#include <limits>
#include <set>
#include <sstream>

namespace MemeEngine {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

/// Where a value sits, for error messages
std::string at(const std::string &context, const char *key) {
  return context.empty() ? std::string(key) : context + "." + key;
}

const json &require(const json &j, const char *key, const std::string &ctx) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw TemplateFormatError("Missing required field '" + at(ctx, key) + "'");
  }
  return *it;
}

std::string require_string(const json &j, const char *key,
                           const std::string &ctx) {
  const json &v = require(j, key, ctx);
  if (!v.is_string()) {
    throw TemplateFormatError("Field '" + at(ctx, key) + "' must be a string");
  }
  return v.get<std::string>();
}

std::string optional_string(const json &j, const char *key,
                            const std::string &ctx, std::string fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw TemplateFormatError("Field '" + at(ctx, key) + "' must be a string");
  }
  return it->get<std::string>();
}

/// Number or null/absent (unset)
std::optional<double> optional_number(const json &j, const char *key,
                                      const std::string &ctx) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    throw TemplateFormatError("Field '" + at(ctx, key) + "' must be a number");
  }
  return it->get<double>();
}

/// Non-negative integer that fits 32 bits; larger values are not truncated
uint32_t to_u32(const json &v, const std::string &name) {
  if (!v.is_number_unsigned()) {
    throw TemplateFormatError("Field '" + name +
                              "' must be a non-negative integer");
  }
  const auto value = v.get<uint64_t>();
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw TemplateFormatError("Field '" + name + "' is out of range: " +
                              std::to_string(value));
  }
  return static_cast<uint32_t>(value);
}

std::optional<uint32_t> optional_dimension(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return to_u32(*it, key);
}

std::string checked_color(const json &j, const char *key,
                          const std::string &ctx, std::string fallback) {
  std::string color = optional_string(j, key, ctx, std::move(fallback));
  if (!Color::parse_hex(color)) {
    throw TemplateFormatError("Field '" + at(ctx, key) +
                              "' is not a hex color: " + color);
  }
  return color;
}

/// Frame index keys are plain decimal integers
uint32_t parse_frame_key(const std::string &key, const std::string &ctx) {
  uint32_t frame = 0;
  const char *first = key.data();
  const char *last = key.data() + key.size();
  auto [ptr, ec] = std::from_chars(first, last, frame);
  if (key.empty() || ec != std::errc() || ptr != last) {
    throw TemplateFormatError("Keyframe key '" + key + "' in '" + ctx +
                              "' is not a frame index");
  }
  return frame;
}

Position parse_position(const json &j, const std::string &ctx) {
  if (!j.is_object()) {
    throw TemplateFormatError("Field '" + ctx + "' must be an object");
  }
  Position pos;
  pos.x = optional_number(j, "x", ctx).value_or(pos.x);
  pos.y = optional_number(j, "y", ctx).value_or(pos.y);
  return pos;
}

KeyframeEntry parse_keyframe(const json &j, const std::string &ctx) {
  if (!j.is_object()) {
    throw TemplateFormatError("Keyframe '" + ctx + "' must be an object");
  }
  KeyframeEntry entry;
  entry.x = optional_number(j, "x", ctx);
  entry.y = optional_number(j, "y", ctx);
  entry.font_size = optional_number(j, "font_size", ctx);
  return entry;
}

TextTemplate parse_text_template(const json &j, size_t index) {
  std::string ctx = "text_templates[" + std::to_string(index) + "]";
  if (!j.is_object()) {
    throw TemplateFormatError("'" + ctx + "' must be an object");
  }

  TextTemplate tt;
  tt.id = require_string(j, "id", ctx);
  tt.font = optional_string(j, "font", ctx, tt.font);
  tt.color = checked_color(j, "color", ctx, tt.color);
  tt.placeholder = optional_string(j, "placeholder", ctx, "");

  std::string align = optional_string(j, "align", ctx, "center");
  auto parsed_align = parse_text_align(align);
  if (!parsed_align) {
    throw TemplateFormatError("Field '" + at(ctx, "align") +
                              "' must be left, center or right, got '" +
                              align + "'");
  }
  tt.align = *parsed_align;

  if (auto stroke = optional_number(j, "stroke_width", ctx)) {
    // Range-checked before narrowing to float
    if (!(*stroke >= 0.0 && *stroke <= MAX_STROKE_WIDTH)) {
      throw ValidationError("Text template '" + tt.id +
                            "': stroke_width must be in [0, 1024]");
    }
    tt.stroke_width = static_cast<float>(*stroke);
  }
  tt.stroke_color = checked_color(j, "stroke_color", ctx, tt.stroke_color);
  if (j.contains("background_color") && !j["background_color"].is_null()) {
    tt.background_color = checked_color(j, "background_color", ctx, "");
  }

  if (j.contains("origin") && !j["origin"].is_null()) {
    tt.origin = parse_position(j["origin"], at(ctx, "origin"));
  }

  auto kf = j.find("keyframes");
  if (kf != j.end() && !kf->is_null()) {
    std::string kf_ctx = at(ctx, "keyframes");
    if (!kf->is_object()) {
      throw TemplateFormatError("Field '" + kf_ctx +
                                "' must be an object keyed by frame index");
    }
    for (const auto &[key, value] : kf->items()) {
      uint32_t frame = parse_frame_key(key, kf_ctx);
      if (tt.keyframes.count(frame)) {
        throw ValidationError("Text template '" + tt.id +
                              "' has two keyframes at frame " +
                              std::to_string(frame));
      }
      tt.keyframes.emplace(frame, parse_keyframe(value, kf_ctx + "." + key));
    }
  }

  return tt;
}

/**
 * @brief Reject repeated object keys while parsing
 *
 * nlohmann::json keeps the last of two equal keys, which would hide a
 * duplicated keyframe index.
 */
class DuplicateKeyGuard {
public:
  bool operator()(int /*depth*/, json::parse_event_t event, json &parsed) {
    switch (event) {
    case json::parse_event_t::object_start:
      scopes_.push_back({last_key_, {}});
      last_key_.clear();
      break;
    case json::parse_event_t::key: {
      std::string key = parsed.get<std::string>();
      if (!scopes_.back().keys.insert(key).second) {
        if (scopes_.back().name == "keyframes") {
          throw ValidationError("Duplicate keyframe index '" + key + "'");
        }
        throw TemplateFormatError("Duplicate key '" + key + "'");
      }
      last_key_ = std::move(key);
      break;
    }
    case json::parse_event_t::object_end:
      last_key_ = scopes_.back().name;
      scopes_.pop_back();
      break;
    default:
      break;
    }
    return true;
  }

private:
  struct Scope {
    std::string name;
    std::set<std::string> keys;
  };
  std::vector<Scope> scopes_;
  std::string last_key_;
};

/// Canonical output: keys alphabetical, keyframes in frame order
ordered_json keyframe_to_json(const KeyframeEntry &entry) {
  ordered_json j = ordered_json::object();
  if (entry.font_size)
    j["font_size"] = *entry.font_size;
  if (entry.x)
    j["x"] = *entry.x;
  if (entry.y)
    j["y"] = *entry.y;
  return j;
}

} // anonymous namespace

/// Main template parser
Template Template::from_json(const std::string &json_str) {
  json j;
  try {
    DuplicateKeyGuard guard;
    j = json::parse(json_str, std::ref(guard));
  } catch (const json::exception &e) {
    throw TemplateFormatError(std::string("Template parse error: ") + e.what());
  }

  if (!j.is_object()) {
    throw TemplateFormatError("Template root must be an object");
  }

  BaseAnimationInfo info;
  info.frame_count = to_u32(require(j, "frame_count", ""), "frame_count");
  info.width = optional_dimension(j, "width");
  info.height = optional_dimension(j, "height");

  const json &list = require(j, "text_templates", "");
  if (!list.is_array()) {
    throw TemplateFormatError("Field 'text_templates' must be an array");
  }

  std::vector<TextTemplate> text_templates;
  text_templates.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    text_templates.push_back(parse_text_template(list[i], i));
  }

  Template tmpl(info, std::move(text_templates));
  tmpl.validate();
  return tmpl;
}

/// Serialize template to JSON
std::string Template::to_json() const {
  ordered_json j;

  j["frame_count"] = animation_.frame_count;
  if (animation_.height)
    j["height"] = *animation_.height;

  j["text_templates"] = ordered_json::array();
  for (const auto &tt : text_templates_) {
    ordered_json tj;
    tj["align"] = to_string(tt.align);
    if (tt.background_color)
      tj["background_color"] = *tt.background_color;
    tj["color"] = tt.color;
    tj["font"] = tt.font;
    tj["id"] = tt.id;

    tj["keyframes"] = ordered_json::object();
    for (const auto &[frame, entry] : tt.keyframes) {
      tj["keyframes"][std::to_string(frame)] = keyframe_to_json(entry);
    }

    tj["origin"] = {{"x", tt.origin.x}, {"y", tt.origin.y}};
    tj["placeholder"] = tt.placeholder;
    tj["stroke_color"] = tt.stroke_color;
    tj["stroke_width"] = tt.stroke_width;
    j["text_templates"].push_back(std::move(tj));
  }

  if (animation_.width)
    j["width"] = *animation_.width;

  return j.dump(2);
}

Template load_template(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOError("Cannot open template", path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw IOError("Failed to read template", path.string());
  }

  try {
    return Template::from_json(buffer.str());
  } catch (const TemplateFormatError &e) {
    throw TemplateFormatError(path.string() + ": " + e.what());
  } catch (const ValidationError &e) {
    throw ValidationError(path.string() + ": " + e.what());
  }
}

void save_template(const Template &tmpl, const std::filesystem::path &path) {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw IOError("Cannot write template", path.string());
  }
  file << tmpl.to_json() << '\n';
  file.flush();
  if (!file) {
    throw IOError("Failed to write template", path.string());
  }
}

std::filesystem::path
paired_template_path(const std::filesystem::path &animation_path) {
  std::filesystem::path json_path = animation_path;
  json_path.replace_extension(".json");
  return json_path;
}

} // namespace MemeEngine
