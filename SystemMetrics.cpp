#include "SystemMetrics.h"
#include "utils.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char* ROUTE_PROBE_ADDR = "8.8.8.8";
constexpr uint16_t ROUTE_PROBE_PORT = 80;

// Closes the descriptor on every exit path
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

bool is_zero_mac(const std::string& mac) {
    for (char c : mac) {
        if (c != '0' && c != ':') return false;
    }
    return true;
}

} // namespace

// --- Constructors ---

SystemMetrics::SystemMetrics()
    : SystemMetrics(getenv_string("LCD_SYS_ROOT", "/sys"), getenv_string("LCD_PROC_ROOT", "/proc")) {}

SystemMetrics::SystemMetrics(const std::string& sys_root, const std::string& proc_root)
    : sys_root_(sys_root), proc_root_(proc_root) {}

// --- Metric Gathering ---

std::optional<double> SystemMetrics::ReadThermalZone(int zone_id) {
    std::string path = sys_root_ + "/class/thermal/thermal_zone" + std::to_string(zone_id) + "/temp";
    std::string line;
    if (!read_first_line(path, line)) return std::nullopt;

    // Content is millidegrees Celsius
    size_t pos = 0;
    long milli_c = 0;
    try {
        milli_c = std::stol(line, &pos);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (pos != line.size()) return std::nullopt;
    return static_cast<double>(milli_c) / 1000.0;
}

bool SystemMetrics::readCpuTimes(uint64_t& total, uint64_t& idle) {
    std::ifstream stat_file(proc_root_ + "/stat");
    std::string line;
    if (!std::getline(stat_file, line)) return false;
    std::stringstream ss(line);

    std::string cpu_label;
    ss >> cpu_label;
    if (cpu_label != "cpu") return false;

    uint64_t user = 0, nice = 0, system = 0, idle_t = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    ss >> user >> nice >> system >> idle_t;
    if (!ss) return false;
    // Older kernels stop after idle
    ss >> iowait >> irq >> softirq >> steal;

    idle = idle_t + iowait;
    total = user + nice + system + idle + irq + softirq + steal;
    return true;
}

double SystemMetrics::CpuLoadPercent() {
    uint64_t current_total = 0, current_idle = 0;
    if (!cpu_primed_) {
        if (!readCpuTimes(prev_cpu_total_, prev_cpu_idle_)) {
            throw std::runtime_error("cannot read " + proc_root_ + "/stat");
        }
        cpu_primed_ = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(std::max(0, cpu_sample_ms_)));
    }
    if (!readCpuTimes(current_total, current_idle)) {
        throw std::runtime_error("cannot read " + proc_root_ + "/stat");
    }

    double usage = 0.0;
    if (current_total > prev_cpu_total_) {
        double total_delta = static_cast<double>(current_total - prev_cpu_total_);
        double idle_delta = (current_idle > prev_cpu_idle_)
                                ? static_cast<double>(current_idle - prev_cpu_idle_)
                                : 0.0;
        usage = 100.0 * (1.0 - idle_delta / total_delta);
    }

    prev_cpu_total_ = current_total;
    prev_cpu_idle_ = current_idle;
    return std::clamp(usage, 0.0, 100.0);
}

MemoryUsage SystemMetrics::GetMemoryUsage() {
    std::ifstream meminfo_file(proc_root_ + "/meminfo");
    if (!meminfo_file.is_open()) {
        throw std::runtime_error("cannot read " + proc_root_ + "/meminfo");
    }
    std::string line;
    uint64_t mem_total = 0, mem_available = 0;
    bool have_available = false;

    while (std::getline(meminfo_file, line)) {
        std::stringstream ss(line);
        std::string key;
        ss >> key;
        if (key == "MemTotal:") {
            ss >> mem_total;
        } else if (key == "MemAvailable:") {
            ss >> mem_available;
            have_available = true;
        }
    }

    if (mem_total == 0 || !have_available) {
        throw std::runtime_error("incomplete " + proc_root_ + "/meminfo");
    }

    MemoryUsage usage;
    usage.total_bytes = mem_total * 1024;
    usage.used_bytes = (mem_total > mem_available ? mem_total - mem_available : 0) * 1024;
    return usage;
}

std::string SystemMetrics::LocalIPv4() {
    // A connected UDP socket never sends anything; connect() only resolves the
    // outgoing route so getsockname() reports the local address for it.
    ScopedFd sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (sock.get() < 0) return LOOPBACK_IPV4;

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(ROUTE_PROBE_PORT);
    if (inet_pton(AF_INET, ROUTE_PROBE_ADDR, &remote.sin_addr) != 1) return LOOPBACK_IPV4;
    if (connect(sock.get(), reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0) {
        return LOOPBACK_IPV4;
    }

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        return LOOPBACK_IPV4;
    }
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) return LOOPBACK_IPV4;
    return std::string(buf);
}

std::string SystemMetrics::readInterfaceMac(const std::string& name) {
    std::string mac;
    if (!read_first_line(sys_root_ + "/class/net/" + name + "/address", mac)) return "";
    if (mac.size() != 17 || is_zero_mac(mac)) return "";
    std::transform(mac.begin(), mac.end(), mac.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mac;
}

std::string SystemMetrics::HardwareMACAddress() {
    if (!mac_if_.empty()) {
        std::string mac = readInterfaceMac(mac_if_);
        if (!mac.empty()) return mac;
    }

    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(sys_root_ + "/class/net", ec)) {
        names.push_back(entry.path().filename().string());
    }
    if (ec) {
        throw std::runtime_error("cannot list " + sys_root_ + "/class/net: " + ec.message());
    }
    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        if (name == "lo") continue;
        std::string mac = readInterfaceMac(name);
        if (!mac.empty()) return mac;
    }
    throw std::runtime_error("no interface with a hardware address");
}

std::chrono::system_clock::time_point SystemMetrics::Now() {
    return std::chrono::system_clock::now();
}
