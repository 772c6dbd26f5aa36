#include "collectors/ProcStatsProvider.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

namespace sysgraph::collectors {

std::expected<double, std::string> ProcStatsProvider::memory_percent() {
  sysgraph::model::Memory m{};
  if (!mem_.sample(m)) return std::unexpected(std::string("cannot read MemTotal from /proc/meminfo"));
  return m.used_pct;
}

std::expected<double, std::string> ProcStatsProvider::cpu_percent(std::chrono::milliseconds interval) {
  sysgraph::model::CpuTimes before{}, after{};
  if (!cpu_.sample(before)) return std::unexpected(std::string("cannot read cpu line from /proc/stat"));
  if (interval.count() > 0) std::this_thread::sleep_for(interval);
  if (!cpu_.sample(after)) return std::unexpected(std::string("cannot read cpu line from /proc/stat"));
  auto pct = CpuCollector::usage_between(before, after);
  if (!pct) return std::unexpected(std::string("cpu counters went backwards"));
  return *pct;
}

std::expected<double, std::string> ProcStatsProvider::disk_percent(const std::string& path) {
  sysgraph::model::FsUsage u{};
  errno = 0;
  if (!fs_.sample(path, u)) {
    int err = errno;
    return std::unexpected("statvfs(" + path + ") failed: " + (err ? std::strerror(err) : "zero-sized filesystem"));
  }
  return u.used_pct;
}

} // namespace sysgraph::collectors
