#ifndef SCROLL_LAYOUT_H
#define SCROLL_LAYOUT_H

#include <chrono>
#include <cstdint>
#include <vector>

// Auto-scroll layout: lines that fit are centered, wider lines scroll left
// one pixel per ms_per_px and wrap back in from the right edge.
struct LayoutParams {
    int viewport_width = 320;
    int line_height = 24;   // font height + line padding
    int64_t ms_per_px = 100; // 10 px/s
};

struct LinePlacement {
    int x = 0;
    int y = 0;
    int width = 0;
    bool scrolling = false;
};

// Pixels scrolled so far for a line of the given width, in [0, width + viewport).
// Zero for lines that fit the viewport.
int ScrollOffset(int text_width, const LayoutParams& params, std::chrono::milliseconds elapsed);

// Horizontal draw position of one line
int LineX(int text_width, const LayoutParams& params, std::chrono::milliseconds elapsed);

// Placement for every line of a frame, widths in snapshot order
std::vector<LinePlacement> LayoutLines(const std::vector<int>& widths,
                                       const LayoutParams& params,
                                       std::chrono::milliseconds elapsed);

#endif // SCROLL_LAYOUT_H
