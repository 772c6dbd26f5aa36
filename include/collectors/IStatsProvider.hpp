#pragma once
#include <chrono>
#include <expected>
#include <string>

namespace sysgraph::collectors {

// Host metric source consumed by the sampler. Every read may fail; the
// error string describes the cause for logging.
class IStatsProvider {
public:
  virtual ~IStatsProvider() = default;

  [[nodiscard]] virtual std::expected<double, std::string> memory_percent() = 0;

  // Blocks for `interval` to average utilization across it.
  [[nodiscard]] virtual std::expected<double, std::string> cpu_percent(std::chrono::milliseconds interval) = 0;

  [[nodiscard]] virtual std::expected<double, std::string> disk_percent(const std::string& path) = 0;

  // Short source name used in error log lines
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace sysgraph::collectors
