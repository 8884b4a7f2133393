#ifndef ST7789_H
#define ST7789_H

#include "FrameSink.h"
#include <gpiod.hpp>
#include <string>
#include <vector>
#include <cstdint>

// ST7789 Commands
const uint8_t ST7789_SWRESET = 0x01;
const uint8_t ST7789_SLPOUT = 0x11;
const uint8_t ST7789_COLMOD = 0x3A;
const uint8_t ST7789_MADCTL = 0x36;
const uint8_t ST7789_CASET = 0x2A;
const uint8_t ST7789_RASET = 0x2B;
const uint8_t ST7789_RAMWR = 0x2C;
const uint8_t ST7789_INVON = 0x21;
const uint8_t ST7789_DISPON = 0x29;

struct ST7789Config {
    std::string spi_device = "/dev/spidev0.1"; // SPI0, CS1
    uint32_t spi_speed_hz = 80000000;
    std::string dc_chip = "/dev/gpiochip0";
    int dc_pin = 19;
    std::string rst_chip = "/dev/gpiochip0";
    int rst_pin = 17;
    std::string bl_chip = "/dev/gpiochip0";
    int bl_pin = 20;

    // 1.9" 320x170 module in landscape; controller RAM is 240x320
    int width = 320;
    int height = 170;
    int offset_x = 0;
    int offset_y = 35;
    uint8_t madctl = 0x60; // MV|MX
};

// SPI + libgpiod transport for ST7789 panels
class ST7789 : public FrameSink {
public:
    explicit ST7789(const ST7789Config& config);
    ~ST7789() override;

    ST7789(const ST7789&) = delete;
    ST7789& operator=(const ST7789&) = delete;

    bool Init();
    bool Submit(const FrameBuffer& frame) override;
    void SetBacklight(bool on);

    int width() const { return config_.width; }
    int height() const { return config_.height; }

private:
    bool SendCommand(uint8_t cmd, const std::vector<uint8_t>& data = {});
    bool SendData(const uint8_t* data, size_t len);
    bool SetDataMode(bool data);
    void Reset();
    bool SetWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);

    ST7789Config config_;
    int spi_fd_ = -1;
    std::vector<uint8_t> tx_buf_;

    gpiod::chip dc_chip_;
    gpiod::line dc_line_;
    gpiod::chip rst_chip_;
    gpiod::line rst_line_;
    gpiod::chip bl_chip_;
    gpiod::line bl_line_;

    bool is_initialized_ = false;
    bool gpio_ready_ = false;
};

#endif // ST7789_H
