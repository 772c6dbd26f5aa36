#pragma once
#include "collectors/IStatsProvider.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/MemoryCollector.hpp"

namespace sysgraph::collectors {

// Linux provider: /proc/meminfo, /proc/stat and statvfs(2).
class ProcStatsProvider final : public IStatsProvider {
public:
  [[nodiscard]] std::expected<double, std::string> memory_percent() override;
  [[nodiscard]] std::expected<double, std::string> cpu_percent(std::chrono::milliseconds interval) override;
  [[nodiscard]] std::expected<double, std::string> disk_percent(const std::string& path) override;
  [[nodiscard]] const char* name() const override { return "procfs"; }

private:
  CpuCollector cpu_{};
  MemoryCollector mem_{};
  FsCollector fs_{};
};

} // namespace sysgraph::collectors
