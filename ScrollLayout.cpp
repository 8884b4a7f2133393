#include "ScrollLayout.h"
#include <algorithm>

int ScrollOffset(int text_width, const LayoutParams& params, std::chrono::milliseconds elapsed) {
    if (text_width <= params.viewport_width) return 0;
    const int64_t period = static_cast<int64_t>(text_width) + params.viewport_width;
    const int64_t step = std::max<int64_t>(1, params.ms_per_px);
    const int64_t ms = std::max<int64_t>(0, elapsed.count());
    // floor((ms / step) mod period) for non-negative integers
    return static_cast<int>((ms / step) % period);
}

int LineX(int text_width, const LayoutParams& params, std::chrono::milliseconds elapsed) {
    text_width = std::max(0, text_width);
    if (text_width <= params.viewport_width) {
        return (params.viewport_width - text_width) / 2;
    }
    return -ScrollOffset(text_width, params, elapsed);
}

std::vector<LinePlacement> LayoutLines(const std::vector<int>& widths,
                                       const LayoutParams& params,
                                       std::chrono::milliseconds elapsed) {
    std::vector<LinePlacement> out;
    out.reserve(widths.size());
    int y = 0;
    for (int w : widths) {
        LinePlacement p;
        p.width = std::max(0, w);
        p.scrolling = p.width > params.viewport_width;
        p.x = LineX(p.width, params, elapsed);
        p.y = y;
        out.push_back(p);
        y += params.line_height;
    }
    return out;
}
