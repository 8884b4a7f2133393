#include "AppConfig.h"
#include "MetricsSampler.h"
#include "Renderer.h"
#include "ST7789.h"
#include "SnapshotStore.h"
#include "SystemMetrics.h"
#include "TrueTypeFont.h"
#include <csignal>
#include <iostream>

static volatile sig_atomic_t running = 1;
static void signal_handler(int) { running = 0; }

int main() {
    std::cout << "Starting LCD Status Monitor..." << std::endl << std::flush;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    AppConfig config = LoadConfigFromEnv();
    std::cout << "  Config: " << DescribeConfig(config) << std::endl << std::flush;

    ST7789Config panel;
    panel.spi_device = config.spi_device;
    panel.spi_speed_hz = config.spi_speed_hz;
    panel.dc_chip = config.dc_chip;
    panel.dc_pin = config.dc_pin;
    panel.rst_chip = config.rst_chip;
    panel.rst_pin = config.rst_pin;
    panel.bl_chip = config.bl_chip;
    panel.bl_pin = config.bl_pin;
    panel.width = config.renderer.width;
    panel.height = config.renderer.height;
    panel.offset_x = config.offset_x;
    panel.offset_y = config.offset_y;

    ST7789 display(panel);
    if (!display.Init()) {
        std::cerr << "Failed to initialize display" << std::endl << std::flush;
        return 1;
    }

    // A missing font leaves a blank panel but the loop keeps running
    TrueTypeFont font;
    if (!font.Load(config.font_path, config.font_px)) {
        std::cerr << "Continuing without text rendering" << std::endl << std::flush;
    }

    SystemMetrics metrics;
    metrics.set_mac_interface(config.mac_interface);
    metrics.set_cpu_sample_ms(config.cpu_sample_ms);

    SnapshotStore store;
    MetricsSampler sampler(metrics, store, config.sampler);
    sampler.Start(); // Start the sampling worker thread

    Renderer renderer(store, font, display, config.renderer);
    renderer.Run(running);

    std::cout << "Stopping..." << std::endl << std::flush;
    sampler.Stop();
    display.SetBacklight(false);
    return 0;
}
