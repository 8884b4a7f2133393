#include "AppConfig.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

AppConfig LoadConfigFromEnv() {
    AppConfig c;

    c.spi_device = getenv_string("LCD_SPI_DEV", c.spi_device);
    int spi_hz = getenv_int("LCD_SPI_HZ", static_cast<int>(c.spi_speed_hz));
    if (spi_hz > 0) c.spi_speed_hz = static_cast<uint32_t>(spi_hz);
    c.dc_chip = getenv_string("LCD_DC_CHIP", c.dc_chip);
    c.dc_pin = getenv_int("LCD_DC_PIN", c.dc_pin);
    c.rst_chip = getenv_string("LCD_RST_CHIP", c.rst_chip);
    c.rst_pin = getenv_int("LCD_RST_PIN", c.rst_pin);
    c.bl_chip = getenv_string("LCD_BL_CHIP", c.bl_chip);
    c.bl_pin = getenv_int("LCD_BL_PIN", c.bl_pin);
    c.offset_x = getenv_int("LCD_OFFSET_X", c.offset_x);
    c.offset_y = getenv_int("LCD_OFFSET_Y", c.offset_y);

    c.font_path = getenv_string("LCD_FONT", c.font_path);
    c.font_px = std::max(6, getenv_int("LCD_FONT_PX", c.font_px));

    c.mac_interface = getenv_string("LCD_MAC_IF", c.mac_interface);
    c.cpu_sample_ms = std::max(0, getenv_int("LCD_CPU_SAMPLE_MS", c.cpu_sample_ms));
    c.debug = getenv_bool("LCD_DEBUG", c.debug);

    c.sampler.interval_ms = std::max(1, getenv_int("LCD_SAMPLE_MS", c.sampler.interval_ms));
    c.sampler.cpu_zone = getenv_int("LCD_CPU_ZONE", c.sampler.cpu_zone);
    c.sampler.hotspot_zone = getenv_int("LCD_HOTSPOT_ZONE", c.sampler.hotspot_zone);
    c.sampler.debug = c.debug;

    c.renderer.line_padding = std::max(0, getenv_int("LCD_LINE_PAD", c.renderer.line_padding));
    c.renderer.perf_log_sec = std::max(0, getenv_int("LCD_PERF_SEC", c.renderer.perf_log_sec));
    return c;
}

std::string DescribeConfig(const AppConfig& c) {
    std::ostringstream ss;
    ss << "spi=" << c.spi_device << "@" << c.spi_speed_hz
       << " dc=" << c.dc_chip << ":" << c.dc_pin
       << " rst=" << c.rst_chip << ":" << c.rst_pin
       << " bl=" << c.bl_chip << ":" << c.bl_pin
       << " panel=" << c.renderer.width << "x" << c.renderer.height
       << " font=" << c.font_path << "@" << c.font_px
       << " sample_ms=" << c.sampler.interval_ms
       << " zones=" << c.sampler.cpu_zone << "/" << c.sampler.hotspot_zone;
    return ss.str();
}
