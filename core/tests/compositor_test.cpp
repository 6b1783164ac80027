/**
 * @file compositor_test.cpp
 * @brief Frame compositing with the built-in block face
 *
 * Block face at 20 px: advance 12, glyph 10x14 starting 2 px below the
 * top of a 20 px line box.
 */

#include "core/color.hpp"
#include "core/errors.hpp"
#include "engine/compositor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace MemeEngine;

namespace {

constexpr uint8_t BASE_GRAY = 40;

ImageBuffer gray_frame(uint32_t w = 100, uint32_t h = 120) {
  ImageBuffer img = ImageBuffer::create(w, h);
  img.fill(BASE_GRAY, BASE_GRAY, BASE_GRAY);
  return img;
}

TextTemplate block_overlay(const std::string &id, double x, double y,
                           TextAlign align = TextAlign::Center) {
  TextTemplate tt;
  tt.id = id;
  tt.font = "block";
  tt.color = "#FFFFFF";
  tt.align = align;
  tt.stroke_width = 0.0f;
  tt.keyframes[0] = KeyframeEntry{x, y, 20.0};
  return tt;
}

bool is_rgb(const ImageBuffer &img, uint32_t x, uint32_t y, uint8_t r,
            uint8_t g, uint8_t b) {
  const uint8_t *p = img.pixel(x, y);
  return p && p[0] == r && p[1] == g && p[2] == b;
}

bool is_base(const ImageBuffer &img, uint32_t x, uint32_t y) {
  return is_rgb(img, x, y, BASE_GRAY, BASE_GRAY, BASE_GRAY);
}

ImageBuffer draw(Text::FontLibrary &fonts, const Template &tmpl,
                 const ImageBuffer &base, std::vector<std::string> texts) {
  Compositor compositor(fonts);
  auto resolved = resolve_all(tmpl, 0);
  return compositor.composite(base, tmpl, resolved, texts);
}

} // anonymous namespace

TEST(FrameCompositor, CenteredTextIsCenteredOnPosition) {
  Text::FontLibrary fonts;
  Template tmpl(BaseAnimationInfo{}, {block_overlay("a", 50, 50)});
  ImageBuffer out = draw(fonts, tmpl, gray_frame(), {"A"});

  // Box 44..55 x 40..59, glyph 44..53 x 42..55
  EXPECT_TRUE(is_rgb(out, 44, 42, 255, 255, 255));
  EXPECT_TRUE(is_rgb(out, 53, 55, 255, 255, 255));
  EXPECT_TRUE(is_base(out, 43, 48));
  EXPECT_TRUE(is_base(out, 54, 48));
  EXPECT_TRUE(is_base(out, 48, 41));
  EXPECT_TRUE(is_base(out, 48, 56));
}

TEST(FrameCompositor, AlignmentAnchorsLeftAndRightEdges) {
  Text::FontLibrary fonts;
  Template left(BaseAnimationInfo{},
                {block_overlay("l", 50, 50, TextAlign::Left)});
  ImageBuffer l = draw(fonts, left, gray_frame(), {"A"});
  EXPECT_TRUE(is_rgb(l, 50, 48, 255, 255, 255));
  EXPECT_TRUE(is_rgb(l, 59, 48, 255, 255, 255));
  EXPECT_TRUE(is_base(l, 49, 48));

  Template right(BaseAnimationInfo{},
                 {block_overlay("r", 50, 50, TextAlign::Right)});
  ImageBuffer r = draw(fonts, right, gray_frame(), {"A"});
  EXPECT_TRUE(is_rgb(r, 38, 48, 255, 255, 255));
  EXPECT_TRUE(is_rgb(r, 47, 48, 255, 255, 255));
  EXPECT_TRUE(is_base(r, 37, 48));
  EXPECT_TRUE(is_base(r, 48, 48));
}

TEST(FrameCompositor, BaseFrameIsNotModified) {
  Text::FontLibrary fonts;
  Template tmpl(BaseAnimationInfo{}, {block_overlay("a", 50, 50)});
  const ImageBuffer base = gray_frame();
  const ImageBuffer before = base;

  ImageBuffer out = draw(fonts, tmpl, base, {"HELLO"});
  EXPECT_TRUE(base == before);
  EXPECT_FALSE(out == base);
}

TEST(FrameCompositor, MissingTextsUsePlaceholders) {
  Text::FontLibrary fonts;
  TextTemplate third = block_overlay("c", 50, 100);
  third.placeholder = "XXXX";
  Template tmpl(BaseAnimationInfo{}, {block_overlay("a", 50, 20),
                                      block_overlay("b", 50, 60), third});

  ImageBuffer two = draw(fonts, tmpl, gray_frame(), {"A", "B"});
  ImageBuffer three = draw(fonts, tmpl, gray_frame(), {"A", "B", "XXXX"});
  EXPECT_TRUE(two == three);

  // Four glyphs start at x=26, a single one at x=44
  EXPECT_TRUE(is_rgb(two, 28, 100, 255, 255, 255));
}

TEST(FrameCompositor, PlaceholderDefaultsToOverlayId) {
  Text::FontLibrary fonts;
  Template tmpl(BaseAnimationInfo{}, {block_overlay("abc", 50, 50)});
  ImageBuffer by_id = draw(fonts, tmpl, gray_frame(), {});
  ImageBuffer explicit_text = draw(fonts, tmpl, gray_frame(), {"abc"});
  EXPECT_TRUE(by_id == explicit_text);
}

TEST(FrameCompositor, TooManyTextsIsAnError) {
  Text::FontLibrary fonts;
  Template tmpl(BaseAnimationInfo{}, {block_overlay("a", 10, 10),
                                      block_overlay("b", 10, 40),
                                      block_overlay("c", 10, 70)});
  std::vector<std::string> four{"1", "2", "3", "4"};
  EXPECT_THROW(draw(fonts, tmpl, gray_frame(), four), TextCountError);
}

TEST(FrameCompositor, StrokeSurroundsFill) {
  Text::FontLibrary fonts;
  TextTemplate tt = block_overlay("a", 50, 50);
  tt.stroke_width = 2.0f;
  tt.stroke_color = "#FF0000";
  Template tmpl(BaseAnimationInfo{}, {tt});
  ImageBuffer out = draw(fonts, tmpl, gray_frame(), {"A"});

  EXPECT_TRUE(is_rgb(out, 48, 48, 255, 255, 255)); // fill on top
  EXPECT_TRUE(is_rgb(out, 42, 48, 255, 0, 0));     // 2 px left of the glyph
  EXPECT_TRUE(is_rgb(out, 48, 40, 255, 0, 0));     // 2 px above
  EXPECT_TRUE(is_base(out, 41, 48));
}

TEST(FrameCompositor, BackgroundBoxAddsMargin) {
  Text::FontLibrary fonts;
  TextTemplate tt = block_overlay("a", 50, 50);
  tt.background_color = "#0000FF";
  Template tmpl(BaseAnimationInfo{}, {tt});
  ImageBuffer out = draw(fonts, tmpl, gray_frame(), {"A"});

  // Text box 44..55 x 40..59 grown by the margin on every side
  EXPECT_TRUE(is_rgb(out, 34, 30, 0, 0, 255));
  EXPECT_TRUE(is_rgb(out, 65, 69, 0, 0, 255));
  EXPECT_TRUE(is_base(out, 33, 30));
  EXPECT_TRUE(is_base(out, 66, 69));
  EXPECT_TRUE(is_rgb(out, 48, 48, 255, 255, 255));
}

TEST(FrameCompositor, TranslucentColorsBlend) {
  Text::FontLibrary fonts;
  TextTemplate tt = block_overlay("a", 50, 50);
  tt.color = "#FFFFFF80";
  Template tmpl(BaseAnimationInfo{}, {tt});
  ImageBuffer out = draw(fonts, tmpl, gray_frame(), {"A"});

  const uint8_t *p = out.pixel(48, 48);
  EXPECT_TRUE(p[0] > BASE_GRAY && p[0] < 255);
  EXPECT_EQ(int(p[0]), int(p[1]));
  EXPECT_EQ(int(p[3]), 255);
}

TEST(FrameCompositor, OffFrameTextIsClipped) {
  Text::FontLibrary fonts;
  Template tmpl(BaseAnimationInfo{}, {block_overlay("a", -5, 5),
                                      block_overlay("b", 200, 300)});
  ImageBuffer out = draw(fonts, tmpl, gray_frame(), {"WIDE TEXT", "GONE"});
  EXPECT_EQ(out.width, 100u);
  EXPECT_TRUE(is_base(out, 99, 119));
}

TEST(FrameCompositor, TextBoxMatchesDrawnArea) {
  Text::FontLibrary fonts;
  Compositor compositor(fonts);
  TextTemplate tt = block_overlay("a", 50, 50);
  TextBox box = compositor.text_box(tt, ResolvedProperties{50, 50, 20}, "AB");
  EXPECT_NEAR(box.width, 24.0, 1e-6);
  EXPECT_NEAR(box.height, 20.0, 1e-6);
  EXPECT_NEAR(box.x, 38.0, 1e-6);
  EXPECT_NEAR(box.y, 40.0, 1e-6);
  EXPECT_TRUE(box.contains(50, 50));
  EXPECT_FALSE(box.contains(63, 50));
}

TEST(FrameCompositor, UnknownFontIsAnIoError) {
  Text::FontLibrary fonts;
  TextTemplate tt = block_overlay("a", 50, 50);
  tt.font = "NoSuchFont-Regular";
  Template tmpl(BaseAnimationInfo{}, {tt});
  EXPECT_THROW(draw(fonts, tmpl, gray_frame(), {"A"}), IOError);
}

TEST(FrameCompositor, HexColorsParseInEveryForm) {
  auto short_form = Color::parse_hex("#F0A");
  EXPECT_TRUE(short_form.has_value());
  EXPECT_EQ(Color::to_hex(*short_form), "#FF00AA");

  auto with_alpha = Color::parse_hex("#11223380");
  EXPECT_TRUE(with_alpha.has_value());
  EXPECT_EQ(int(with_alpha->a), 0x80);
  EXPECT_EQ(Color::to_hex(*with_alpha), "#11223380");

  EXPECT_FALSE(Color::parse_hex("#12345"));
  EXPECT_FALSE(Color::parse_hex("white"));
  EXPECT_FALSE(Color::parse_hex(""));
}
