#include "minitest.hpp"
#include "SystemMetrics.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root(const std::string& name) {
  auto root = fs::temp_directory_path() / fs::path("lcd_test_" + name + "_") / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sys/class/thermal");
  fs::create_directories(root / "sys/class/net");
  fs::create_directories(root / "proc");
  return root;
}

static void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

TEST(system_metrics_reads_thermal_zone) {
  auto root = make_root("thermal");
  write_file(root / "sys/class/thermal/thermal_zone0/temp", "56123\n");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  auto t = m.ReadThermalZone(0);
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(std::fabs(*t - 56.123) < 1e-9);
  fs::remove_all(root);
}

TEST(system_metrics_thermal_missing_or_garbage) {
  auto root = make_root("thermal_bad");
  write_file(root / "sys/class/thermal/thermal_zone1/temp", "hot\n");
  write_file(root / "sys/class/thermal/thermal_zone2/temp", "");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  ASSERT_FALSE(m.ReadThermalZone(0).has_value());
  ASSERT_FALSE(m.ReadThermalZone(1).has_value());
  ASSERT_FALSE(m.ReadThermalZone(2).has_value());
  fs::remove_all(root);
}

TEST(system_metrics_parses_meminfo) {
  auto root = make_root("mem");
  write_file(root / "proc/meminfo",
             "MemTotal:       2097152 kB\n"
             "MemFree:         524288 kB\n"
             "MemAvailable:   1572864 kB\n");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  auto mem = m.GetMemoryUsage();
  ASSERT_EQ(mem.total_bytes, 2097152ull * 1024);
  ASSERT_EQ(mem.used_bytes, 524288ull * 1024);
  fs::remove_all(root);
}

TEST(system_metrics_meminfo_missing_throws) {
  auto root = make_root("mem_missing");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  bool threw = false;
  try { m.GetMemoryUsage(); } catch (const std::exception&) { threw = true; }
  ASSERT_TRUE(threw);
  fs::remove_all(root);
}

TEST(system_metrics_cpu_load_from_stat_deltas) {
  auto root = make_root("cpu");
  write_file(root / "proc/stat", "cpu  100 0 100 800 0 0 0 0\ncpu0 100 0 100 800 0 0 0 0\n");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  m.set_cpu_sample_ms(0);
  ASSERT_EQ(m.CpuLoadPercent(), 0.0);
  // +100 busy, +100 idle => 50%
  write_file(root / "proc/stat", "cpu  150 0 150 900 0 0 0 0\ncpu0 150 0 150 900 0 0 0 0\n");
  double load = m.CpuLoadPercent();
  ASSERT_TRUE(std::fabs(load - 50.0) < 1e-9);
  fs::remove_all(root);
}

TEST(system_metrics_mac_prefers_configured_interface) {
  auto root = make_root("mac_pref");
  write_file(root / "sys/class/net/eth0/address", "02:00:00:00:00:01\n");
  write_file(root / "sys/class/net/wlan0/address", "de:ad:be:ef:00:02\n");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  m.set_mac_interface("wlan0");
  ASSERT_EQ(m.HardwareMACAddress(), std::string("DE:AD:BE:EF:00:02"));
  fs::remove_all(root);
}

TEST(system_metrics_mac_skips_loopback_and_zero) {
  auto root = make_root("mac_scan");
  write_file(root / "sys/class/net/lo/address", "00:00:00:00:00:00\n");
  write_file(root / "sys/class/net/dummy0/address", "00:00:00:00:00:00\n");
  write_file(root / "sys/class/net/eth1/address", "0a:1b:2c:3d:4e:5f\n");
  write_file(root / "sys/class/net/wlan0/address", "de:ad:be:ef:00:02\n");
  SystemMetrics m((root / "sys").string(), (root / "proc").string());
  ASSERT_EQ(m.HardwareMACAddress(), std::string("0A:1B:2C:3D:4E:5F"));
  fs::remove_all(root);
}

TEST(system_metrics_local_ipv4_is_dotted_quad) {
  SystemMetrics m;
  std::string ip = m.LocalIPv4();
  int dots = 0;
  for (char c : ip) if (c == '.') ++dots;
  ASSERT_EQ(dots, 3);
}
