#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>
#include "app/ChartLayout.hpp"
#include "app/HistoryStore.hpp"
#include "app/StatsSampler.hpp"
#include "model/Chart.hpp"

namespace sysgraph::app {

// Drives sampler -> store -> layout on a dedicated thread, one tick per
// interval. Ticks never overlap: a tick that overruns its slot causes the
// missed firings to be dropped (and logged), keeping the original grid.
class Ticker {
public:
  enum class State { Idle, Updating };

  struct Stats {
    uint64_t ticks{};    // ticks run
    uint64_t failed{};   // ticks whose sample failed
    uint64_t dropped{};  // firings skipped because a tick overran
  };

  static constexpr std::chrono::milliseconds kInterval{5000};

  Ticker(StatsSampler& sampler, HistoryStore& store, const ChartLayout& layout,
         std::chrono::milliseconds interval = kInterval);
  ~Ticker();
  Ticker(const Ticker&) = delete;
  Ticker& operator=(const Ticker&) = delete;

  void start();
  void stop();

  // One Idle -> Updating -> Idle pass. Returns the payloads published
  // afterwards; on sampling failure these are the previous ones.
  std::vector<model::ChartPayload> tick();

  [[nodiscard]] std::vector<model::ChartPayload> latest() const;
  [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
  [[nodiscard]] Stats stats() const;
  [[nodiscard]] const ChartLayout& layout() const { return layout_; }
  [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
  void run(std::stop_token st);

  StatsSampler& sampler_;
  HistoryStore& store_;
  const ChartLayout& layout_;
  std::chrono::milliseconds interval_;

  std::mutex tick_mu_; // serializes tick() between the thread and direct callers
  mutable std::mutex pub_mu_;
  std::vector<model::ChartPayload> published_;

  std::atomic<State> state_{State::Idle};
  std::atomic<uint64_t> ticks_{0}, failed_{0}, dropped_{0};

  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
  std::jthread thread_{};
};

} // namespace sysgraph::app
