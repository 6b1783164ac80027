/**
 * @file cli_test.cpp
 * @brief generate_meme command line: flags, text binding and exit codes
 *
 * Runs the built binary (GENERATE_MEME_PATH) against template pairs
 * written into a scratch directory.
 */

#include "engine/engine.hpp"
#include "io/gif.hpp"

#include <gtest/gtest.h>

#include <sys/wait.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace MemeEngine;

namespace {

const char *THREE_OVERLAYS = R"({
  "frame_count": 2,
  "text_templates": [
    {"id": "top", "font": "block",
     "keyframes": {"0": {"x": 40, "y": 10, "font_size": 10}}},
    {"id": "middle", "font": "block",
     "keyframes": {"0": {"x": 40, "y": 25, "font_size": 10}}},
    {"id": "bottom", "font": "block",
     "keyframes": {"0": {"x": 40, "y": 40, "font_size": 10},
                   "1": {"x": 50}}}
  ]
})";

class GenerateMemeCli : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("meme_cli_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    gif_ = dir_ / "base.gif";
    IO::save_gif(Animation::solid(80, 50, 2, 90, 30, 30, 30), gif_);
    write_template(THREE_OVERLAYS);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  void write_template(const std::string &json) {
    std::ofstream out(dir_ / "base.json");
    out << json;
  }

  /// Exit status of generate_meme with @p args; output goes to a log file
  int run(const std::vector<std::string> &args) {
    std::string command = std::string("\"") + GENERATE_MEME_PATH + "\"";
    for (const auto &arg : args) {
      command += " \"" + arg + "\"";
    }
    command += " > \"" + (dir_ / "cli.log").string() + "\" 2>&1";

    int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status)) {
      return -1;
    }
    return WEXITSTATUS(status);
  }

  std::filesystem::path dir_;
  std::filesystem::path gif_;
};

} // anonymous namespace

TEST_F(GenerateMemeCli, HelpExitsZero) {
  EXPECT_EQ(run({"--help"}), 0);
  EXPECT_EQ(run({"-h"}), 0);
}

TEST_F(GenerateMemeCli, UsageErrorsExitOne) {
  EXPECT_EQ(run({}), 1);
  EXPECT_EQ(run({gif_.string(), "--bogus"}), 1);
  EXPECT_EQ(run({gif_.string(), "-t"}), 1);
  EXPECT_EQ(run({gif_.string(), "--threads", "lots"}), 1);
}

TEST_F(GenerateMemeCli, WritesDefaultOutput) {
  EXPECT_EQ(run({gif_.string(), "-t", "HI"}), 0);
  Animation out = IO::load_gif(dir_ / "base_meme.gif");
  EXPECT_EQ(out.frame_count(), 2u);
  EXPECT_EQ(out.frames[1].duration_ms, 90u);
}

TEST_F(GenerateMemeCli, RepeatedTextFlagsBindInOrder) {
  const auto cli_out = dir_ / "cli.gif";
  ASSERT_EQ(run({gif_.string(), "-t", "A", "--text", "BB", "-o",
                 cli_out.string(), "--threads", "2"}),
            0);

  Engine engine;
  const auto ordered =
      engine.render_file(gif_, {"A", "BB"}, dir_ / "ordered.gif");
  const auto swapped =
      engine.render_file(gif_, {"BB", "A"}, dir_ / "swapped.gif");

  Animation from_cli = IO::load_gif(cli_out);
  Animation expected = IO::load_gif(ordered);
  Animation other = IO::load_gif(swapped);
  ASSERT_EQ(from_cli.frame_count(), expected.frame_count());
  for (size_t i = 0; i < from_cli.frame_count(); ++i) {
    EXPECT_TRUE(from_cli.frames[i].image == expected.frames[i].image);
    EXPECT_FALSE(from_cli.frames[i].image == other.frames[i].image);
  }
}

TEST_F(GenerateMemeCli, MalformedTemplateExitsTwo) {
  write_template(R"({"frame_count": 2, "text_templates": "nope"})");
  EXPECT_EQ(run({gif_.string()}), 2);
}

TEST_F(GenerateMemeCli, ValidationFailureExitsThree) {
  write_template(R"({"frame_count": 7, "text_templates": [{"id": "a"}]})");
  EXPECT_EQ(run({gif_.string()}), 3);
}

TEST_F(GenerateMemeCli, TooManyTextsExitsFour) {
  EXPECT_EQ(run({gif_.string(), "-t", "1", "-t", "2", "-t", "3", "-t", "4"}),
            4);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "base_meme.gif"));
}

TEST_F(GenerateMemeCli, FileProblemsExitFive) {
  // GIF without a paired template
  IO::save_gif(Animation::solid(8, 8, 1, 100, 0, 0, 0), dir_ / "lonely.gif");
  EXPECT_EQ(run({(dir_ / "lonely.gif").string()}), 5);

  EXPECT_EQ(run({gif_.string(), "-o", "/nonexistent/dir/out.gif"}), 5);
  EXPECT_EQ(run({gif_.string(), "--config", (dir_ / "none.json").string()}),
            5);
}
