#ifndef METRICS_SAMPLER_H
#define METRICS_SAMPLER_H

#include "Snapshot.h"
#include "SnapshotStore.h"
#include "SystemMetrics.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

struct SamplerConfig {
    int interval_ms = 1000;
    int cpu_zone = 0;
    int hotspot_zone = 1;
    bool debug = false;
};

// Periodic worker: builds one Snapshot per cycle from a MetricSource and
// publishes it to the store. A failing metric degrades to a placeholder
// value; nothing thrown by the source ends the loop.
class MetricsSampler {
public:
    static constexpr const char* UNAVAILABLE = "N/A";

    MetricsSampler(MetricSource& source, SnapshotStore& store, const SamplerConfig& config = SamplerConfig());
    ~MetricsSampler();

    MetricsSampler(const MetricsSampler&) = delete;
    MetricsSampler& operator=(const MetricsSampler&) = delete;

    void Start();
    void Stop();
    bool is_running() const { return running_; }

    // One full sampling pass, published to the store
    void RunOnce();

    Snapshot BuildSnapshot();

    uint64_t cycles() const { return cycles_; }

private:
    std::string ipLine();
    std::string macLine();
    std::string timeLine();
    std::string temperatureLine();
    std::string cpuLoadLine();
    std::string memoryLine();
    std::string formatZone(int zone_id);

    void worker_func();

    MetricSource& source_;
    SnapshotStore& store_;
    SamplerConfig config_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

#endif // METRICS_SAMPLER_H
