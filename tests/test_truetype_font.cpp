#include "minitest.hpp"
#include "TrueTypeFont.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Real font for the measurement checks; empty when none is installed
static std::string find_font() {
  const char* env = std::getenv("LCD_FONT");
  if (env && fs::exists(env)) return env;
  const char* candidates[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
  };
  for (const char* c : candidates) {
    if (fs::exists(c)) return c;
  }
  return "";
}

static fs::path write_garbage_font() {
  auto dir = fs::temp_directory_path() / fs::path("lcd_test_font_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(dir);
  auto p = dir / "garbage.ttf";
  std::ofstream(p, std::ios::binary) << std::string(256, 'x');
  return p;
}

TEST(font_rejects_missing_and_garbage_files) {
  auto garbage = write_garbage_font();
  TrueTypeFont font;
  ASSERT_FALSE(font.Load("/nonexistent/font.ttf", 22));
  ASSERT_FALSE(font.Load(garbage.string(), 22));
  ASSERT_FALSE(font.is_loaded());
  ASSERT_EQ(font.MeasureWidth("CPU Load: 1.0%"), 0);
  fs::remove_all(garbage.parent_path());
}

TEST(font_failed_reload_keeps_previous_font) {
  std::string path = find_font();
  if (path.empty()) return;
  auto garbage = write_garbage_font();

  TrueTypeFont font;
  ASSERT_TRUE(font.Load(path, 22));
  const int before = font.MeasureWidth("CPU/Hotspot: 41.3/43.0\xC2\xB0" "C");
  ASSERT_TRUE(before > 0);

  ASSERT_FALSE(font.Load(garbage.string(), 22));
  ASSERT_FALSE(font.Load("/nonexistent/font.ttf", 22));
  ASSERT_TRUE(font.is_loaded());
  ASSERT_EQ(font.FontHeight(), 22);
  ASSERT_EQ(font.MeasureWidth("CPU/Hotspot: 41.3/43.0\xC2\xB0" "C"), before);
  fs::remove_all(garbage.parent_path());
}

TEST(font_measures_degree_sign_as_single_glyph) {
  std::string path = find_font();
  if (path.empty()) return;
  TrueTypeFont font;
  ASSERT_TRUE(font.Load(path, 22));
  const int degree = font.MeasureWidth("\xC2\xB0");
  ASSERT_TRUE(degree > 0);
  // Two bytes decoded as one glyph, not two replacement glyphs
  ASSERT_TRUE(degree < font.MeasureWidth("\xEF\xBF\xBD\xEF\xBF\xBD"));
  ASSERT_EQ(font.MeasureWidth(""), 0);
}
