#pragma once
#include <cstdint>
#include <string>

namespace sysgraph::model {

// Aggregate jiffies from the first line of /proc/stat
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t available_kb{};
  double   used_pct{}; // 0..100
};

struct FsUsage {
  std::string path;       // e.g. /
  uint64_t total_bytes{};
  uint64_t used_bytes{};
  uint64_t avail_bytes{};
  double   used_pct{};    // 0..100
};

} // namespace sysgraph::model
