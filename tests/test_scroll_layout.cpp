#include "minitest.hpp"
#include "ScrollLayout.h"
#include <chrono>

using std::chrono::milliseconds;

static LayoutParams params_320() {
  LayoutParams p;
  p.viewport_width = 320;
  p.line_height = 24;
  p.ms_per_px = 100;
  return p;
}

TEST(layout_centers_line_that_fits) {
  // 12.03.2024 10:00:00 measured at 180px
  ASSERT_EQ(LineX(180, params_320(), milliseconds(0)), 70);
}

TEST(layout_centered_line_ignores_time) {
  auto p = params_320();
  ASSERT_EQ(LineX(181, p, milliseconds(0)), LineX(181, p, milliseconds(123456)));
  ASSERT_EQ(LineX(181, p, milliseconds(0)), 69);
  ASSERT_EQ(LineX(0, p, milliseconds(999)), 160);
}

TEST(layout_exact_fit_is_centered_at_zero) {
  auto p = params_320();
  ASSERT_EQ(LineX(320, p, milliseconds(0)), 0);
  ASSERT_EQ(LineX(320, p, milliseconds(50000)), 0);
  ASSERT_EQ(ScrollOffset(320, p, milliseconds(50000)), 0);
}

TEST(layout_scrolling_line_starts_at_zero) {
  ASSERT_EQ(LineX(500, params_320(), milliseconds(0)), 0);
}

TEST(layout_scrolling_line_mid_period) {
  auto p = params_320();
  ASSERT_EQ(ScrollOffset(500, p, milliseconds(41000)), 410);
  ASSERT_EQ(LineX(500, p, milliseconds(41000)), -410);
  // Sub-step time rounds down
  ASSERT_EQ(LineX(500, p, milliseconds(41099)), -410);
}

TEST(layout_scroll_wraps_after_full_period) {
  auto p = params_320();
  const int width = 500;
  const long period_ms = (width + p.viewport_width) * p.ms_per_px; // 820 px
  for (long t = 0; t < 3 * period_ms; t += 1237) {
    ASSERT_EQ(LineX(width, p, milliseconds(t)), LineX(width, p, milliseconds(t + period_ms)));
  }
  ASSERT_EQ(ScrollOffset(width, p, milliseconds(period_ms - 1)), 819);
  ASSERT_EQ(ScrollOffset(width, p, milliseconds(period_ms)), 0);
}

TEST(layout_scroll_offset_stays_in_period) {
  auto p = params_320();
  for (long t = 0; t < 200000; t += 997) {
    int off = ScrollOffset(700, p, milliseconds(t));
    ASSERT_TRUE(off >= 0 && off < 700 + 320);
  }
}

TEST(layout_negative_elapsed_clamps_to_start) {
  ASSERT_EQ(LineX(500, params_320(), milliseconds(-5000)), 0);
}

TEST(layout_lines_stack_in_order) {
  auto p = params_320();
  auto placed = LayoutLines({100, 500, 320}, p, milliseconds(41000));
  ASSERT_EQ(placed.size(), 3u);
  ASSERT_EQ(placed[0].y, 0);
  ASSERT_EQ(placed[1].y, 24);
  ASSERT_EQ(placed[2].y, 48);
  ASSERT_EQ(placed[0].x, 110);
  ASSERT_FALSE(placed[0].scrolling);
  ASSERT_EQ(placed[1].x, -410);
  ASSERT_TRUE(placed[1].scrolling);
  ASSERT_EQ(placed[2].x, 0);
  ASSERT_FALSE(placed[2].scrolling);
}

TEST(layout_empty_frame) {
  ASSERT_TRUE(LayoutLines({}, params_320(), milliseconds(1000)).empty());
}
