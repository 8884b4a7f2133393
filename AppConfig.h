#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include "MetricsSampler.h"
#include "Renderer.h"
#include <cstdint>
#include <string>

// Everything tunable, read once from LCD_* environment variables at startup.
struct AppConfig {
    // Panel transport
    std::string spi_device = "/dev/spidev0.1";
    uint32_t spi_speed_hz = 80000000;
    std::string dc_chip = "/dev/gpiochip0";
    int dc_pin = 19;
    std::string rst_chip = "/dev/gpiochip0";
    int rst_pin = 17;
    std::string bl_chip = "/dev/gpiochip0";
    int bl_pin = 20;
    int offset_x = 0;
    int offset_y = 35;

    // Text
    std::string font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";
    int font_px = 22;

    // Metric sources
    std::string mac_interface;
    int cpu_sample_ms = 250;

    bool debug = false;

    SamplerConfig sampler;
    RendererConfig renderer;
};

AppConfig LoadConfigFromEnv();

// One-line summary for the startup log
std::string DescribeConfig(const AppConfig& config);

#endif // APP_CONFIG_H
