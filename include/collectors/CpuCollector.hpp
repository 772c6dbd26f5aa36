#pragma once
#include <optional>
#include "model/Host.hpp"

namespace sysgraph::collectors {

class CpuCollector {
public:
  // Read the aggregate "cpu" line of /proc/stat.
  bool sample(sysgraph::model::CpuTimes& out) const;

  // Busy percentage between two readings. nullopt if the counters went
  // backwards (e.g. a different fixture or a counter reset).
  static std::optional<double> usage_between(const sysgraph::model::CpuTimes& before,
                                             const sysgraph::model::CpuTimes& after);
};

} // namespace sysgraph::collectors
