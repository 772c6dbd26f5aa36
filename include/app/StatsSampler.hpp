#pragma once
#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include "collectors/IStatsProvider.hpp"
#include "model/Sample.hpp"

namespace sysgraph::app {

struct SamplingError {
  enum class Kind { ProviderFetchError, OutOfRange };
  Kind kind{Kind::ProviderFetchError};
  std::string metric;  // "ram" | "cpu" | "disk"
  std::string message;
};

const char* to_string(SamplingError::Kind k);

struct SamplerOptions {
  std::string disk_path{"/"};
  std::chrono::milliseconds cpu_window{1000};
};

// Produces one MetricSample per call from an IStatsProvider, or fails as
// a whole, including when a provider read throws. Never retries; logs
// one line per call.
class StatsSampler {
public:
  // Wall clock used for timestamps; system_clock when empty
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit StatsSampler(collectors::IStatsProvider& provider, SamplerOptions opts = {},
                        Clock clock = nullptr);

  [[nodiscard]] std::expected<model::MetricSample, SamplingError> sample();

private:
  collectors::IStatsProvider& provider_;
  SamplerOptions opts_;
  Clock clock_;
};

// Local wall-clock time formatted HH:MM:SS.
[[nodiscard]] std::string format_hms(std::chrono::system_clock::time_point tp);

} // namespace sysgraph::app
