#ifndef TRUETYPE_FONT_H
#define TRUETYPE_FONT_H

#include "TextPainter.h"
#include <cstdint>
#include <string>
#include <vector>

// stb_truetype backed TextPainter. Text is UTF-8.
class TrueTypeFont : public TextPainter {
public:
    TrueTypeFont();
    ~TrueTypeFont() override;

    TrueTypeFont(const TrueTypeFont&) = delete;
    TrueTypeFont& operator=(const TrueTypeFont&) = delete;

    bool Load(const std::string& font_path, int pixel_height);
    bool is_loaded() const { return font_info_ != nullptr; }

    int MeasureWidth(const std::string& text) const override;
    int FontHeight() const override { return pixel_height_; }
    void DrawText(FrameBuffer& frame, int x, int y, const std::string& text, color_t color) const override;

private:
    std::vector<uint8_t> font_buffer_;
    void* font_info_ = nullptr; // stbtt_fontinfo
    int pixel_height_ = 0;
    float scale_ = 0.0f;
    int ascent_px_ = 0;
};

#endif // TRUETYPE_FONT_H
