#pragma once
/**
 * @file template.hpp
 * @brief Meme template: text overlays with keyframed position and size
 *
 * A Template is bound to one base animation (by frame count and, when
 * recorded, pixel size) and holds its text overlays in declaration order.
 * Each overlay carries static styling plus a keyframe timeline whose
 * entries pin x, y and font size independently.
 */

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MemeEngine {

struct Animation;

/// Widest stroke outline, in pixels
inline constexpr double MAX_STROKE_WIDTH = 1024.0;

/// Horizontal anchoring of text relative to its x position
enum class TextAlign { Left, Center, Right };

/// Position in frame pixels
struct Position {
  double x = 20.0;
  double y = 20.0;

  [[nodiscard]] bool operator==(const Position &) const = default;
};

/**
 * @brief Animatable fields pinned at one frame
 *
 * Every field is independently set or unset; an unset field is interpolated
 * from the neighbouring keyframes that do set it.
 */
struct KeyframeEntry {
  std::optional<double> x;
  std::optional<double> y;
  std::optional<double> font_size;

  [[nodiscard]] bool empty() const noexcept {
    return !x && !y && !font_size;
  }

  /// Copy the set fields of @p other over this entry
  void merge(const KeyframeEntry &other);

  [[nodiscard]] bool operator==(const KeyframeEntry &) const = default;
};

/// One text overlay
struct TextTemplate {
  std::string id;
  std::string font = "Montserrat-Regular";
  std::string color = "#FFF";
  TextAlign align = TextAlign::Center;
  std::string placeholder;

  float stroke_width = 2.0f;
  std::string stroke_color = "#000";
  std::optional<std::string> background_color;

  /// Position used while no keyframe sets x or y
  Position origin;

  std::map<uint32_t, KeyframeEntry> keyframes;

  /// Keyframes sorted by frame index
  [[nodiscard]] std::vector<std::pair<uint32_t, KeyframeEntry>>
  ordered_keyframes() const;

  /// Placeholder, or the id when no placeholder was given
  [[nodiscard]] const std::string &display_text() const noexcept {
    return placeholder.empty() ? id : placeholder;
  }

  [[nodiscard]] bool operator==(const TextTemplate &) const = default;
};

/// Identity of the paired base animation
struct BaseAnimationInfo {
  uint32_t frame_count = 1;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;

  [[nodiscard]] bool operator==(const BaseAnimationInfo &) const = default;
};

/**
 * @brief Root template structure
 */
class Template {
public:
  Template() = default;
  explicit Template(BaseAnimationInfo animation,
                    std::vector<TextTemplate> text_templates = {});

  [[nodiscard]] const BaseAnimationInfo &animation() const noexcept {
    return animation_;
  }
  [[nodiscard]] uint32_t frame_count() const noexcept {
    return animation_.frame_count;
  }

  [[nodiscard]] const std::vector<TextTemplate> &text_templates() const noexcept {
    return text_templates_;
  }
  [[nodiscard]] size_t size() const noexcept { return text_templates_.size(); }

  /// Overlay by id, nullptr when absent
  [[nodiscard]] const TextTemplate *find(const std::string &id) const;

  // --- Editing (used by editors before a template is saved) ---

  /// Append an overlay; throws ValidationError on a duplicate or empty id
  void add_text_template(TextTemplate text_template);

  /// Remove an overlay by id; returns false when absent
  bool remove_text_template(const std::string &id);

  /**
   * @brief Insert a keyframe, merging into an existing one at the same frame
   * @throws ValidationError for an unknown id or an out-of-range frame
   */
  void insert_keyframe(const std::string &id, uint32_t frame,
                       const KeyframeEntry &entry);

  /// Remove the keyframe at @p frame; returns false when absent
  bool remove_keyframe(const std::string &id, uint32_t frame);

  // --- Validation ---

  /**
   * @brief Check model invariants
   * @throws ValidationError on duplicate/empty ids, out-of-range keyframes,
   *         non-finite values or non-positive font sizes
   */
  void validate() const;

  /**
   * @brief Check compatibility with a loaded base animation
   * @throws ValidationError on frame count or size mismatch
   */
  void validate_against(const Animation &base) const;

  // --- Serialization ---

  /// Parse template from JSON string
  static Template from_json(const std::string &json);

  /// Serialize to canonical JSON string
  [[nodiscard]] std::string to_json() const;

  [[nodiscard]] bool operator==(const Template &) const = default;

private:
  TextTemplate *find_mutable(const std::string &id);

  BaseAnimationInfo animation_;
  std::vector<TextTemplate> text_templates_;
};

/// Parse alignment name (left, center, right)
[[nodiscard]] std::optional<TextAlign> parse_text_align(const std::string &name);

/// Alignment name as written to JSON
[[nodiscard]] const char *to_string(TextAlign align) noexcept;

/// Load and validate `<name>.json`
[[nodiscard]] Template load_template(const std::filesystem::path &path);

/// Write canonical JSON
void save_template(const Template &tmpl, const std::filesystem::path &path);

/// `<dir>/<stem>.json` for `<dir>/<stem>.gif`
[[nodiscard]] std::filesystem::path
paired_template_path(const std::filesystem::path &animation_path);

} // namespace MemeEngine
