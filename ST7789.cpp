#include "ST7789.h"
#include "FrameBuffer.h"
#include <iostream>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace {
constexpr size_t CHUNK_SIZE_BYTES = 4096;
}

ST7789::ST7789(const ST7789Config& config)
    : config_(config) {
    try {
        std::cout << "  [GPIO] Opening DC chip " << config_.dc_chip << "..." << std::endl << std::flush;
        dc_chip_ = gpiod::chip(config_.dc_chip, gpiod::chip::OPEN_BY_PATH);
        std::cout << "  [GPIO] Opening RST chip " << config_.rst_chip << "..." << std::endl << std::flush;
        rst_chip_ = gpiod::chip(config_.rst_chip, gpiod::chip::OPEN_BY_PATH);
        std::cout << "  [GPIO] Opening BL chip " << config_.bl_chip << "..." << std::endl << std::flush;
        bl_chip_ = gpiod::chip(config_.bl_chip, gpiod::chip::OPEN_BY_PATH);

        dc_line_ = dc_chip_.get_line(config_.dc_pin);
        rst_line_ = rst_chip_.get_line(config_.rst_pin);
        bl_line_ = bl_chip_.get_line(config_.bl_pin);

        dc_line_.request({"st7789-dc", gpiod::line_request::DIRECTION_OUTPUT, 0});
        rst_line_.request({"st7789-rst", gpiod::line_request::DIRECTION_OUTPUT, 0});
        bl_line_.request({"st7789-bl", gpiod::line_request::DIRECTION_OUTPUT, 0});
        std::cout << "  [GPIO] Lines requested (dc=" << config_.dc_pin
                  << " rst=" << config_.rst_pin << " bl=" << config_.bl_pin << ")." << std::endl << std::flush;
        gpio_ready_ = true;
    } catch (const std::exception& e) {
        std::cerr << "  [GPIO] Init failed: " << e.what() << std::endl << std::flush;
        gpio_ready_ = false;
    }
}

ST7789::~ST7789() {
    if (is_initialized_) {
        SetBacklight(false);
    }
    if (spi_fd_ != -1) {
        close(spi_fd_);
    }
}

bool ST7789::Init() {
    if (!gpio_ready_) {
        std::cerr << "  [SPI] GPIO not initialized, cannot init display" << std::endl << std::flush;
        return false;
    }
    spi_fd_ = open(config_.spi_device.c_str(), O_RDWR);
    if (spi_fd_ < 0) {
        std::cerr << "  [SPI] Failed to open " << config_.spi_device << ": " << std::strerror(errno)
                  << std::endl << std::flush;
        return false;
    }

    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    uint32_t speed = config_.spi_speed_hz;
    if (ioctl(spi_fd_, SPI_IOC_WR_MODE, &mode) == -1 ||
        ioctl(spi_fd_, SPI_IOC_WR_BITS_PER_WORD, &bits) == -1 ||
        ioctl(spi_fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed) == -1) {
        std::cerr << "  [SPI] Failed to set SPI parameters: " << std::strerror(errno) << std::endl << std::flush;
        close(spi_fd_);
        spi_fd_ = -1;
        return false;
    }
    std::cout << "  [SPI] " << config_.spi_device << " @ " << speed << " Hz" << std::endl << std::flush;

    try {
        Reset();
    } catch (const std::exception& e) {
        std::cerr << "  [GPIO] Reset failed: " << e.what() << std::endl << std::flush;
        close(spi_fd_);
        spi_fd_ = -1;
        return false;
    }

    bool ok = SendCommand(ST7789_SWRESET);
    usleep(150000);
    ok = ok && SendCommand(ST7789_SLPOUT);
    usleep(50000);
    ok = ok && SendCommand(ST7789_COLMOD, {0x05}); // 16-bit/pixel
    ok = ok && SendCommand(ST7789_MADCTL, {config_.madctl});
    ok = ok && SendCommand(ST7789_INVON);
    ok = ok && SendCommand(ST7789_DISPON);
    usleep(10000);
    if (!ok) {
        std::cerr << "  [SPI] Panel init sequence failed" << std::endl << std::flush;
        close(spi_fd_);
        spi_fd_ = -1;
        return false;
    }

    SetBacklight(true);
    std::cout << "  Display ready (" << config_.width << "x" << config_.height << ")." << std::endl << std::flush;
    is_initialized_ = true;
    return true;
}

bool ST7789::SetDataMode(bool data) {
    try {
        dc_line_.set_value(data ? 1 : 0);
    } catch (const std::exception& e) {
        std::cerr << "  [GPIO] DC line failed: " << e.what() << std::endl << std::flush;
        return false;
    }
    return true;
}

bool ST7789::SendCommand(uint8_t cmd, const std::vector<uint8_t>& data) {
    if (!SetDataMode(false)) return false;
    if (write(spi_fd_, &cmd, 1) != 1) {
        std::cerr << "  [SPI] Failed to send command 0x" << std::hex << static_cast<int>(cmd) << std::dec
                  << std::endl << std::flush;
        return false;
    }
    if (!data.empty()) {
        return SendData(data.data(), data.size());
    }
    return true;
}

bool ST7789::SendData(const uint8_t* data, size_t len) {
    if (!SetDataMode(true)) return false;
    for (size_t i = 0; i < len; i += CHUNK_SIZE_BYTES) {
        size_t n = std::min(CHUNK_SIZE_BYTES, len - i);
        struct spi_ioc_transfer tr = {};
        tr.tx_buf = reinterpret_cast<unsigned long>(data + i);
        tr.len = static_cast<uint32_t>(n);
        tr.speed_hz = config_.spi_speed_hz;
        tr.bits_per_word = 8;
        if (ioctl(spi_fd_, SPI_IOC_MESSAGE(1), &tr) < 1) {
            std::cerr << "  [SPI] Transfer failed: " << std::strerror(errno) << std::endl << std::flush;
            return false;
        }
    }
    return true;
}

bool ST7789::Submit(const FrameBuffer& frame) {
    if (!is_initialized_) return false;
    if (frame.width() != config_.width || frame.height() != config_.height) {
        std::cerr << "  [SPI] Frame " << frame.width() << "x" << frame.height()
                  << " does not match panel " << config_.width << "x" << config_.height << std::endl << std::flush;
        return false;
    }

    if (!SetWindow(0, 0, static_cast<uint16_t>(config_.width - 1), static_cast<uint16_t>(config_.height - 1))) {
        return false;
    }

    // RGB565 big-endian on the wire
    const auto& px = frame.pixels();
    tx_buf_.resize(px.size() * 2);
    for (size_t i = 0; i < px.size(); ++i) {
        tx_buf_[i * 2] = (px[i] >> 8) & 0xFF;
        tx_buf_[i * 2 + 1] = px[i] & 0xFF;
    }
    return SendData(tx_buf_.data(), tx_buf_.size());
}

void ST7789::SetBacklight(bool on) {
    if (!gpio_ready_) return;
    try {
        bl_line_.set_value(on ? 1 : 0);
    } catch (const std::exception& e) {
        std::cerr << "  [GPIO] Backlight failed: " << e.what() << std::endl << std::flush;
    }
}

void ST7789::Reset() {
    rst_line_.set_value(1);
    usleep(10000);
    rst_line_.set_value(0);
    usleep(10000);
    rst_line_.set_value(1);
    usleep(120000);
}

bool ST7789::SetWindow(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    x0 += config_.offset_x;
    x1 += config_.offset_x;
    y0 += config_.offset_y;
    y1 += config_.offset_y;

    return SendCommand(ST7789_CASET, {
               (uint8_t)(x0 >> 8), (uint8_t)(x0 & 0xFF),
               (uint8_t)(x1 >> 8), (uint8_t)(x1 & 0xFF),
           }) &&
           SendCommand(ST7789_RASET, {
               (uint8_t)(y0 >> 8), (uint8_t)(y0 & 0xFF),
               (uint8_t)(y1 >> 8), (uint8_t)(y1 & 0xFF),
           }) &&
           SendCommand(ST7789_RAMWR);
}
