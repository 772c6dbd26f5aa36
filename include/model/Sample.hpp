#pragma once
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace sysgraph::model {

// One reading of every tracked metric, taken on a single tick.
struct MetricSample {
  double ram_pct{};   // 0..100
  double cpu_pct{};   // 0..100
  double disk_pct{};  // 0..100
  std::string timestamp; // HH:MM:SS, local time
};

inline bool valid_pct(double v) { return !std::isnan(v) && v >= 0.0 && v <= 100.0; }

inline bool valid_sample(const MetricSample& s) {
  return valid_pct(s.ram_pct) && valid_pct(s.cpu_pct) && valid_pct(s.disk_pct);
}

// Point-in-time copy of the rolling history, oldest first.
// Index i of every sequence refers to the same tick.
struct HistorySnapshot {
  std::vector<double> ram;
  std::vector<double> cpu;
  std::vector<double> disk;
  std::vector<std::string> time;
  uint64_t seq{}; // successful records since startup

  size_t size() const { return time.size(); }
  bool empty() const { return time.empty(); }
  bool operator==(const HistorySnapshot&) const = default;
};

} // namespace sysgraph::model
