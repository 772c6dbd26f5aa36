#include "minitest.hpp"
#include "FakeProvider.hpp"
#include "app/StatsSampler.hpp"
#include <ctime>

using sysgraph::app::SamplingError;
using sysgraph::app::StatsSampler;

// 2024-01-02 13:14:15 local time
static std::chrono::system_clock::time_point fixed_time() {
  std::tm tm{};
  tm.tm_year = 124; tm.tm_mon = 0; tm.tm_mday = 2;
  tm.tm_hour = 13; tm.tm_min = 14; tm.tm_sec = 15;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

TEST(sampler_success_builds_full_sample) {
  FakeProvider p;
  p.ram = 42.5; p.cpu = 12.0; p.disk = 77.25;
  sysgraph::app::SamplerOptions opts;
  opts.disk_path = "/data";
  opts.cpu_window = std::chrono::milliseconds(250);
  StatsSampler sampler(p, opts, fixed_time);
  auto r = sampler.sample();
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->ram_pct, 42.5);
  ASSERT_EQ(r->cpu_pct, 12.0);
  ASSERT_EQ(r->disk_pct, 77.25);
  ASSERT_EQ(r->timestamp, "13:14:15");
  ASSERT_EQ(p.last_cpu_interval_ms.load(), 250);
  ASSERT_EQ(p.last_disk_path, "/data");
}

TEST(sampler_defaults_to_root_volume_and_one_second_window) {
  FakeProvider p;
  StatsSampler sampler(p);
  auto r = sampler.sample();
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(p.last_disk_path, "/");
  ASSERT_EQ(p.last_cpu_interval_ms.load(), 1000);
  ASSERT_EQ(r->timestamp.size(), 8u);
  ASSERT_EQ(r->timestamp[2], ':');
  ASSERT_EQ(r->timestamp[5], ':');
}

TEST(sampler_fails_whole_sample_on_any_fetch_error) {
  {
    FakeProvider p; p.fail_ram = true;
    StatsSampler sampler(p, {}, fixed_time);
    auto r = sampler.sample();
    ASSERT_FALSE(r.has_value());
    ASSERT_TRUE(r.error().kind == SamplingError::Kind::ProviderFetchError);
    ASSERT_EQ(r.error().metric, "ram");
    ASSERT_EQ(r.error().message, "meminfo unavailable");
  }
  {
    FakeProvider p; p.fail_cpu = true;
    StatsSampler sampler(p, {std::string("/"), std::chrono::milliseconds(0)}, fixed_time);
    auto r = sampler.sample();
    ASSERT_FALSE(r.has_value());
    ASSERT_EQ(r.error().metric, "cpu");
  }
  {
    FakeProvider p; p.fail_disk = true;
    StatsSampler sampler(p, {std::string("/"), std::chrono::milliseconds(0)}, fixed_time);
    auto r = sampler.sample();
    ASSERT_FALSE(r.has_value());
    ASSERT_EQ(r.error().metric, "disk");
  }
}

TEST(sampler_rejects_out_of_range_values) {
  FakeProvider p;
  p.cpu = 100.5;
  StatsSampler sampler(p, {std::string("/"), std::chrono::milliseconds(0)}, fixed_time);
  auto r = sampler.sample();
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().kind == SamplingError::Kind::OutOfRange);
  ASSERT_EQ(r.error().metric, "cpu");

  p.cpu = 10.0; p.disk = -1.0;
  r = sampler.sample();
  ASSERT_FALSE(r.has_value());
  ASSERT_EQ(r.error().metric, "disk");
  ASSERT_EQ(std::string(sysgraph::app::to_string(r.error().kind)), "OutOfRange");
}

TEST(sampler_format_hms_zero_pads) {
  std::tm tm{};
  tm.tm_year = 124; tm.tm_mon = 5; tm.tm_mday = 1;
  tm.tm_hour = 3; tm.tm_min = 4; tm.tm_sec = 5;
  tm.tm_isdst = -1;
  auto tp = std::chrono::system_clock::from_time_t(std::mktime(&tm));
  ASSERT_EQ(sysgraph::app::format_hms(tp), "03:04:05");
}

TEST(sampler_maps_throwing_read_to_fetch_error) {
  FakeProvider p; p.throw_cpu = true;
  StatsSampler sampler(p, {std::string("/"), std::chrono::milliseconds(0)}, fixed_time);
  auto r = sampler.sample();
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().kind == SamplingError::Kind::ProviderFetchError);
  ASSERT_EQ(r.error().metric, "cpu");
  ASSERT_EQ(r.error().message, "cpu read blew up");
  ASSERT_EQ(p.in_flight.load(), 0);
}
