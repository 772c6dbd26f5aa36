#include "app/HistoryStore.hpp"

namespace sysgraph::app {

bool HistoryStore::record(const model::MetricSample& sample) {
  if (!model::valid_sample(sample)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  ram_.push(sample.ram_pct);
  cpu_.push(sample.cpu_pct);
  disk_.push(sample.disk_pct);
  time_.push(sample.timestamp);
  ++seq_;
  return true;
}

model::HistorySnapshot HistoryStore::snapshot() const {
  model::HistorySnapshot s;
  std::lock_guard<std::mutex> lk(mu_);
  s.ram = ram_.to_vector();
  s.cpu = cpu_.to_vector();
  s.disk = disk_.to_vector();
  s.time = time_.to_vector();
  s.seq = seq_;
  return s;
}

size_t HistoryStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return time_.size();
}

uint64_t HistoryStore::seq() const {
  std::lock_guard<std::mutex> lk(mu_);
  return seq_;
}

} // namespace sysgraph::app
