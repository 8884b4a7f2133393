#ifndef TEXT_PAINTER_H
#define TEXT_PAINTER_H

#include "Theme.h"
#include <string>

class FrameBuffer;

// Font-bound text measurement and drawing.
class TextPainter {
public:
    virtual ~TextPainter() = default;

    // Rendered advance width of text in pixels, >= 0
    virtual int MeasureWidth(const std::string& text) const = 0;

    // Nominal pixel height the font was loaded at
    virtual int FontHeight() const = 0;

    // (x, y) is the top-left corner of the text line
    virtual void DrawText(FrameBuffer& frame, int x, int y, const std::string& text, color_t color) const = 0;
};

#endif // TEXT_PAINTER_H
