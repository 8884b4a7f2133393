#ifndef SYSTEM_METRICS_H
#define SYSTEM_METRICS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Reported when the local address cannot be determined
constexpr const char* LOOPBACK_IPV4 = "127.0.0.1";

struct MemoryUsage {
    uint64_t used_bytes = 0;
    uint64_t total_bytes = 0;
};

// Raw metric collaborators consumed by the sampler. Implementations may
// block briefly (file reads, CPU sampling window) and may throw; the
// sampler guards every call.
class MetricSource {
public:
    virtual ~MetricSource() = default;

    // Degrees Celsius, nullopt if the zone is missing or unreadable
    virtual std::optional<double> ReadThermalZone(int zone_id) = 0;
    virtual double CpuLoadPercent() = 0;
    virtual MemoryUsage GetMemoryUsage() = 0;
    virtual std::string LocalIPv4() = 0;
    virtual std::string HardwareMACAddress() = 0;
    virtual std::chrono::system_clock::time_point Now() = 0;
};

// Linux sysfs/procfs implementation
class SystemMetrics : public MetricSource {
public:
    // Roots default to LCD_SYS_ROOT / LCD_PROC_ROOT, then "/sys" and "/proc"
    SystemMetrics();
    SystemMetrics(const std::string& sys_root, const std::string& proc_root);

    std::optional<double> ReadThermalZone(int zone_id) override;
    double CpuLoadPercent() override;
    MemoryUsage GetMemoryUsage() override;
    std::string LocalIPv4() override;
    std::string HardwareMACAddress() override;
    std::chrono::system_clock::time_point Now() override;

    void set_mac_interface(const std::string& name) { mac_if_ = name; }
    void set_cpu_sample_ms(int ms) { cpu_sample_ms_ = ms; }

private:
    bool readCpuTimes(uint64_t& total, uint64_t& idle);
    std::string readInterfaceMac(const std::string& name);

    std::string sys_root_;
    std::string proc_root_;
    std::string mac_if_;
    int cpu_sample_ms_ = 250;

    // For CPU calculation
    uint64_t prev_cpu_total_ = 0;
    uint64_t prev_cpu_idle_ = 0;
    bool cpu_primed_ = false;
};

#endif // SYSTEM_METRICS_H
