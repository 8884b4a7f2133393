#ifndef FRAME_BUFFER_H
#define FRAME_BUFFER_H

#include "Theme.h"
#include <cstdint>
#include <vector>

// RGB565 frame owned by the render loop. Writes outside the buffer are dropped.
class FrameBuffer {
public:
    FrameBuffer(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    void Clear(color_t color);
    void SetPixel(int x, int y, color_t color);
    color_t GetPixel(int x, int y) const;

    const std::vector<uint16_t>& pixels() const { return pixels_; }

private:
    int width_;
    int height_;
    std::vector<uint16_t> pixels_;
};

#endif // FRAME_BUFFER_H
