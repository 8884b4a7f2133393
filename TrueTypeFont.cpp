#include "TrueTypeFont.h"
#include "FrameBuffer.h"
#include "utils.h"
#include <cmath>
#include <fstream>
#include <iostream>

#include "stb_truetype.h"

TrueTypeFont::TrueTypeFont() = default;

TrueTypeFont::~TrueTypeFont() {
    if (font_info_) {
        delete static_cast<stbtt_fontinfo*>(font_info_);
    }
}

bool TrueTypeFont::Load(const std::string& font_path, int pixel_height) {
    std::ifstream file(font_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "  [FONT] Failed to open font file: " << font_path << std::endl << std::flush;
        return false;
    }
    std::streamsize file_size = file.tellg();
    // Smaller than an sfnt header
    if (file_size < 12) {
        std::cerr << "  [FONT] Truncated font file: " << font_path << std::endl << std::flush;
        return false;
    }
    file.seekg(0, std::ios::beg);

    // Current font stays usable until the replacement is fully initialized
    std::vector<uint8_t> buffer(static_cast<size_t>(file_size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), file_size)) {
        std::cerr << "  [FONT] Failed to read font file" << std::endl << std::flush;
        return false;
    }

    int offset = stbtt_GetFontOffsetForIndex(buffer.data(), 0);
    if (offset < 0) {
        std::cerr << "  [FONT] Not a TrueType/OpenType font: " << font_path << std::endl << std::flush;
        return false;
    }
    auto* info = new stbtt_fontinfo();
    if (!stbtt_InitFont(info, buffer.data(), offset)) {
        std::cerr << "  [FONT] Failed to initialize font" << std::endl << std::flush;
        delete info;
        return false;
    }

    // info->data points into the vector's heap block, which survives the swap
    font_buffer_.swap(buffer);
    if (font_info_) {
        delete static_cast<stbtt_fontinfo*>(font_info_);
    }
    font_info_ = info;

    pixel_height_ = pixel_height;
    scale_ = stbtt_ScaleForPixelHeight(info, static_cast<float>(pixel_height));
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info, &ascent, &descent, &line_gap);
    ascent_px_ = static_cast<int>(std::lround(ascent * scale_));
    std::cout << "  [FONT] Loaded " << font_path << " @ " << pixel_height << "px" << std::endl << std::flush;
    return true;
}

int TrueTypeFont::MeasureWidth(const std::string& text) const {
    if (!font_info_) return 0;
    auto* info = static_cast<stbtt_fontinfo*>(font_info_);
    float pen = 0.0f;
    size_t i = 0;
    int prev = 0;
    while (i < text.size()) {
        int cp = utf8_next_codepoint(text, i);
        if (prev) pen += scale_ * stbtt_GetCodepointKernAdvance(info, prev, cp);
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);
        pen += advance * scale_;
        prev = cp;
    }
    return static_cast<int>(std::lround(pen));
}

void TrueTypeFont::DrawText(FrameBuffer& frame, int x, int y, const std::string& text, color_t color) const {
    if (!font_info_) return;
    auto* info = static_cast<stbtt_fontinfo*>(font_info_);
    const int baseline = y + ascent_px_;
    float pen = static_cast<float>(x);
    size_t i = 0;
    int prev = 0;

    thread_local std::vector<uint8_t> bitmap;
    while (i < text.size()) {
        int cp = utf8_next_codepoint(text, i);
        if (prev) pen += scale_ * stbtt_GetCodepointKernAdvance(info, prev, cp);
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);

        int c_x1, c_y1, c_x2, c_y2;
        stbtt_GetCodepointBitmapBox(info, cp, scale_, scale_, &c_x1, &c_y1, &c_x2, &c_y2);
        int w = c_x2 - c_x1;
        int h = c_y2 - c_y1;
        int gx = static_cast<int>(std::floor(pen)) + c_x1;

        // Glyphs entirely off the frame still advance the pen
        if (w > 0 && h > 0 && gx + w > 0 && gx < frame.width()) {
            bitmap.resize(static_cast<size_t>(w) * h);
            stbtt_MakeCodepointBitmap(info, bitmap.data(), w, h, w, scale_, scale_, cp);
            for (int j = 0; j < h; ++j) {
                for (int k = 0; k < w; ++k) {
                    // 1-bit coverage, the panel has no use for alpha blending
                    if (bitmap[static_cast<size_t>(j) * w + k] >= 0x80) {
                        frame.SetPixel(gx + k, baseline + c_y1 + j, color);
                    }
                }
            }
        }
        pen += advance * scale_;
        prev = cp;
    }
}
