#include "minitest.hpp"
#include "app/HistoryStore.hpp"
#include <atomic>
#include <cmath>
#include <cstdio>
#include <thread>

using sysgraph::app::HistoryStore;
using sysgraph::model::MetricSample;

static std::string hms(int i) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "00:%02d:%02d", (i / 60) % 60, i % 60);
  return buf;
}

static MetricSample numbered(int i) {
  return MetricSample{static_cast<double>(i), static_cast<double>(i) / 2.0,
                      static_cast<double>(100 - i), hms(i)};
}

TEST(history_store_starts_empty) {
  HistoryStore store;
  auto s = store.snapshot();
  ASSERT_TRUE(s.empty());
  ASSERT_TRUE(s.ram.empty() && s.cpu.empty() && s.disk.empty());
  ASSERT_EQ(s.seq, 0u);
  ASSERT_EQ(HistoryStore::capacity(), 20u);
}

TEST(history_store_single_record_scenario) {
  HistoryStore store;
  ASSERT_TRUE(store.record(MetricSample{10, 5, 50, "00:00:00"}));
  auto s = store.snapshot();
  ASSERT_EQ(s.ram, std::vector<double>{10});
  ASSERT_EQ(s.cpu, std::vector<double>{5});
  ASSERT_EQ(s.disk, std::vector<double>{50});
  ASSERT_EQ(s.time, std::vector<std::string>{"00:00:00"});
  ASSERT_EQ(s.seq, 1u);
}

TEST(history_store_keeps_last_twenty_of_twenty_five) {
  HistoryStore store;
  for (int i = 1; i <= 25; ++i) ASSERT_TRUE(store.record(numbered(i)));
  auto s = store.snapshot();
  ASSERT_EQ(s.ram.size(), 20u);
  ASSERT_EQ(s.cpu.size(), 20u);
  ASSERT_EQ(s.disk.size(), 20u);
  ASSERT_EQ(s.time.size(), 20u);
  for (int i = 0; i < 20; ++i) ASSERT_EQ(s.ram[i], static_cast<double>(6 + i));
  ASSERT_EQ(s.seq, 25u);
}

TEST(history_store_fifo_evicts_exactly_the_oldest) {
  HistoryStore store;
  for (int i = 1; i <= 20; ++i) ASSERT_TRUE(store.record(numbered(i)));
  ASSERT_EQ(store.snapshot().time.front(), hms(1));
  ASSERT_TRUE(store.record(numbered(21)));
  auto s = store.snapshot();
  ASSERT_EQ(s.time.front(), hms(2));
  ASSERT_EQ(s.ram.front(), 2.0);
  ASSERT_EQ(s.time.back(), hms(21));
  ASSERT_EQ(store.size(), 20u);
}

TEST(history_store_index_alignment) {
  HistoryStore store;
  for (int i = 1; i <= 47; ++i) ASSERT_TRUE(store.record(numbered(i)));
  auto s = store.snapshot();
  for (size_t k = 0; k < s.size(); ++k) {
    int origin = static_cast<int>(s.ram[k]);
    ASSERT_EQ(s.cpu[k], origin / 2.0);
    ASSERT_EQ(s.disk[k], static_cast<double>(100 - origin));
    ASSERT_EQ(s.time[k], hms(origin));
  }
}

TEST(history_store_rejects_out_of_range) {
  HistoryStore store;
  ASSERT_TRUE(store.record(numbered(3)));
  auto before = store.snapshot();
  ASSERT_FALSE(store.record(MetricSample{101.0, 5, 5, "00:00:01"}));
  ASSERT_FALSE(store.record(MetricSample{5, -0.1, 5, "00:00:01"}));
  ASSERT_FALSE(store.record(MetricSample{5, 5, std::nan(""), "00:00:01"}));
  ASSERT_TRUE(store.snapshot() == before);
  // Bounds themselves are valid
  ASSERT_TRUE(store.record(MetricSample{0.0, 100.0, 0.0, "00:00:02"}));
}

TEST(history_store_readers_never_see_unequal_lengths) {
  HistoryStore store;
  std::atomic<bool> run{true};
  std::atomic<int> bad{0};
  std::atomic<int> reads{0};
  std::thread reader([&]{
    while (run.load()) {
      auto s = store.snapshot();
      if (s.ram.size() != s.time.size() || s.cpu.size() != s.time.size() || s.disk.size() != s.time.size())
        bad.fetch_add(1);
      for (size_t k = 0; k < s.size(); ++k)
        if (s.time[k] != hms(static_cast<int>(s.ram[k]))) bad.fetch_add(1);
      reads.fetch_add(1);
    }
  });
  for (int i = 1; i <= 5000; ++i) (void)store.record(numbered(i % 100));
  run.store(false);
  reader.join();
  ASSERT_EQ(bad.load(), 0);
  ASSERT_TRUE(reads.load() > 0);
}
