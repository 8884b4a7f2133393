#include "FrameBuffer.h"
#include <algorithm>

FrameBuffer::FrameBuffer(int width, int height)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      pixels_(static_cast<size_t>(width_) * height_, 0) {}

void FrameBuffer::Clear(color_t color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
}

void FrameBuffer::SetPixel(int x, int y, color_t color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    pixels_[static_cast<size_t>(y) * width_ + x] = color;
}

color_t FrameBuffer::GetPixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return 0;
    return pixels_[static_cast<size_t>(y) * width_ + x];
}
