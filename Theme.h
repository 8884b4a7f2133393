#ifndef THEME_H
#define THEME_H

#include <cstdint>

// RGB565 Color representation
using color_t = uint16_t;

// Helper to convert RGB888 to RGB565
constexpr color_t RGB(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<color_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
}

// Single fixed palette: white text on black
struct Theme {
    color_t background;
    color_t text;
};

constexpr Theme STATUS_THEME = {
    RGB(0, 0, 0),
    RGB(255, 255, 255)
};

#endif // THEME_H
