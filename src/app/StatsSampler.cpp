#include "app/StatsSampler.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <ctime>
#include <exception>

namespace sysgraph::app {

const char* to_string(SamplingError::Kind k) {
  switch (k) {
    case SamplingError::Kind::ProviderFetchError: return "ProviderFetchError";
    case SamplingError::Kind::OutOfRange: return "OutOfRange";
  }
  return "unknown";
}

std::string format_hms(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

StatsSampler::StatsSampler(collectors::IStatsProvider& provider, SamplerOptions opts, Clock clock)
    : provider_(provider), opts_(std::move(opts)), clock_(std::move(clock)) {
  if (!clock_) clock_ = []{ return std::chrono::system_clock::now(); };
}

// Run one provider read and turn it into a percentage or a SamplingError.
// A read that throws fails the same way as one that reports an error.
template <typename Read>
static std::expected<double, SamplingError> fetch(const char* metric, Read&& read) {
  std::expected<double, std::string> r;
  try {
    r = read();
  } catch (const std::exception& e) {
    return std::unexpected(SamplingError{SamplingError::Kind::ProviderFetchError, metric, e.what()});
  }
  if (!r) return std::unexpected(SamplingError{SamplingError::Kind::ProviderFetchError, metric, r.error()});
  if (!model::valid_pct(*r)) {
    char msg[64];
    std::snprintf(msg, sizeof(msg), "value %g outside [0,100]", *r);
    return std::unexpected(SamplingError{SamplingError::Kind::OutOfRange, metric, msg});
  }
  return *r;
}

std::expected<model::MetricSample, SamplingError> StatsSampler::sample() {
  auto fail = [this](const SamplingError& e) {
    SYSGRAPH_LOG_ERROR("sampler", "error fetching system stats from %s: %s (%s): %s",
                       provider_.name(), e.metric.c_str(), to_string(e.kind), e.message.c_str());
    return std::unexpected(e);
  };

  auto ram = fetch("ram", [&]{ return provider_.memory_percent(); });
  if (!ram) return fail(ram.error());
  auto cpu = fetch("cpu", [&]{ return provider_.cpu_percent(opts_.cpu_window); });
  if (!cpu) return fail(cpu.error());
  auto disk = fetch("disk", [&]{ return provider_.disk_percent(opts_.disk_path); });
  if (!disk) return fail(disk.error());

  // Stamped after the blocking CPU read, so the label trails the reading
  // window by up to cpu_window.
  model::MetricSample s{*ram, *cpu, *disk, format_hms(clock_())};
  SYSGRAPH_LOG_INFO("sampler", "fetched ram=%.1f%% cpu=%.1f%% disk=%.1f%% at %s",
                    s.ram_pct, s.cpu_pct, s.disk_pct, s.timestamp.c_str());
  return s;
}

} // namespace sysgraph::app
