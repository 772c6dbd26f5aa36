#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "model/Sample.hpp"
#include "util/RingBuffer.hpp"

namespace sysgraph::app {

// Rolling history of the last kCapacity samples: four index-aligned
// sequences (ram, cpu, disk, time). One writer (the tick thread), any
// number of readers. record() and snapshot() are each atomic with
// respect to one another, so readers never see unequal lengths.
class HistoryStore {
public:
  static constexpr size_t kCapacity = 20;

  HistoryStore() = default;
  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  // Append one sample, evicting the oldest when full. Rejects samples
  // with a percentage outside [0,100]; the store is then unchanged.
  bool record(const model::MetricSample& sample);

  // Copy of current contents, oldest first.
  [[nodiscard]] model::HistorySnapshot snapshot() const;

  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t seq() const;
  static constexpr size_t capacity() { return kCapacity; }

private:
  mutable std::mutex mu_;
  util::RingBuffer<double, kCapacity> ram_;
  util::RingBuffer<double, kCapacity> cpu_;
  util::RingBuffer<double, kCapacity> disk_;
  util::RingBuffer<std::string, kCapacity> time_;
  uint64_t seq_{0};
};

} // namespace sysgraph::app
