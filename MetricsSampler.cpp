#include "MetricsSampler.h"
#include "utils.h"
#include <ctime>
#include <exception>
#include <iostream>
#include <utility>

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

} // namespace

// Runs one metric getter; any exception becomes the fallback text.
// Template so each line keeps its own formatting lambda.
template <typename Fn>
static std::string guarded(const char* what, bool debug, const std::string& fallback, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        if (debug) {
            std::cerr << "  [SAMPLER] " << what << " unavailable: " << e.what() << std::endl << std::flush;
        }
    } catch (...) {
        if (debug) {
            std::cerr << "  [SAMPLER] " << what << " unavailable: unknown exception" << std::endl << std::flush;
        }
    }
    return fallback;
}

MetricsSampler::MetricsSampler(MetricSource& source, SnapshotStore& store, const SamplerConfig& config)
    : source_(source), store_(store), config_(config) {
    if (config_.interval_ms < 1) config_.interval_ms = 1;
}

MetricsSampler::~MetricsSampler() {
    Stop();
}

void MetricsSampler::Start() {
    if (!running_) {
        running_ = true;
        worker_ = std::thread(&MetricsSampler::worker_func, this);
    }
}

void MetricsSampler::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MetricsSampler::RunOnce() {
    store_.Publish(BuildSnapshot());
    ++cycles_;
}

Snapshot MetricsSampler::BuildSnapshot() {
    Snapshot snap;
    snap.lines.reserve(6);
    snap.lines.push_back({ipLine()});
    snap.lines.push_back({macLine()});
    snap.lines.push_back({timeLine()});
    snap.lines.push_back({temperatureLine()});
    snap.lines.push_back({cpuLoadLine()});
    snap.lines.push_back({memoryLine()});
    return snap;
}

// --- Lines ---

std::string MetricsSampler::ipLine() {
    std::string ip = guarded("ipv4", config_.debug, LOOPBACK_IPV4, [&] {
        std::string addr = source_.LocalIPv4();
        return addr.empty() ? std::string(LOOPBACK_IPV4) : addr;
    });
    return "IPv4: " + ip;
}

std::string MetricsSampler::macLine() {
    return "MAC: " + guarded("mac", config_.debug, UNAVAILABLE, [&] {
        std::string mac = source_.HardwareMACAddress();
        return mac.empty() ? std::string(UNAVAILABLE) : mac;
    });
}

std::string MetricsSampler::timeLine() {
    return guarded("clock", config_.debug, UNAVAILABLE, [&] {
        std::time_t t = std::chrono::system_clock::to_time_t(source_.Now());
        std::tm local{};
        if (!localtime_r(&t, &local)) return std::string(UNAVAILABLE);
        char buf[32];
        if (std::strftime(buf, sizeof(buf), "%d.%m.%Y %H:%M:%S", &local) == 0) {
            return std::string(UNAVAILABLE);
        }
        return std::string(buf);
    });
}

std::string MetricsSampler::formatZone(int zone_id) {
    return guarded("thermal zone", config_.debug, UNAVAILABLE, [&] {
        std::optional<double> c = source_.ReadThermalZone(zone_id);
        return c ? format_fixed(*c, 1) : std::string(UNAVAILABLE);
    });
}

std::string MetricsSampler::temperatureLine() {
    return "CPU/Hotspot: " + formatZone(config_.cpu_zone) + "/" + formatZone(config_.hotspot_zone) + "\xC2\xB0" "C";
}

std::string MetricsSampler::cpuLoadLine() {
    return "CPU Load: " + guarded("cpu load", config_.debug, UNAVAILABLE, [&] {
        return format_fixed(source_.CpuLoadPercent(), 1) + "%";
    });
}

std::string MetricsSampler::memoryLine() {
    return "RAM: " + guarded("memory", config_.debug, UNAVAILABLE, [&] {
        MemoryUsage mem = source_.GetMemoryUsage();
        return format_fixed(mem.used_bytes / BYTES_PER_MB, 1) + "/" +
               format_fixed(mem.total_bytes / BYTES_PER_MB, 1) + " MB";
    });
}

// --- Worker ---

void MetricsSampler::worker_func() {
    const auto interval = std::chrono::milliseconds(config_.interval_ms);
    auto next_tick = std::chrono::steady_clock::now();
    while (running_) {
        try {
            RunOnce();
        } catch (const std::exception& e) {
            // Publish only allocates; keep sampling if it ever throws
            std::cerr << "  [SAMPLER] cycle failed: " << e.what() << std::endl << std::flush;
        }

        next_tick += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            // Overran the period: restart the schedule instead of bursting
            next_tick = now;
        }
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_until(lock, next_tick, [this] { return !running_; });
    }
}
