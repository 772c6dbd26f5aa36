#include "app/Ticker.hpp"
#include "util/Log.hpp"

using namespace std::chrono;

namespace sysgraph::app {

Ticker::Ticker(StatsSampler& sampler, HistoryStore& store, const ChartLayout& layout,
               milliseconds interval)
    : sampler_(sampler), store_(store), layout_(layout), interval_(interval) {
  if (interval_ < 1ms) interval_ = 1ms;
}

Ticker::~Ticker() { stop(); }

void Ticker::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Ticker::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

std::vector<model::ChartPayload> Ticker::tick() {
  std::lock_guard<std::mutex> serial(tick_mu_);
  state_.store(State::Updating, std::memory_order_release);
  ticks_.fetch_add(1, std::memory_order_relaxed);

  auto sample = sampler_.sample();
  if (!sample) {
    // History untouched; keep serving what was last rendered
    failed_.fetch_add(1, std::memory_order_relaxed);
    state_.store(State::Idle, std::memory_order_release);
    SYSGRAPH_LOG_INFO("ticker", "no data fetched this tick");
    return latest();
  }

  if (!store_.record(*sample)) {
    // Sampler validates ranges already; reaching here means the two disagree
    failed_.fetch_add(1, std::memory_order_relaxed);
    state_.store(State::Idle, std::memory_order_release);
    SYSGRAPH_LOG_WARN("ticker", "store rejected sample at %s", sample->timestamp.c_str());
    return latest();
  }

  auto charts = layout_.render(store_.snapshot());
  {
    std::lock_guard<std::mutex> lk(pub_mu_);
    published_ = charts;
  }
  state_.store(State::Idle, std::memory_order_release);
  return charts;
}

std::vector<model::ChartPayload> Ticker::latest() const {
  std::lock_guard<std::mutex> lk(pub_mu_);
  return published_;
}

Ticker::Stats Ticker::stats() const {
  return Stats{ticks_.load(std::memory_order_relaxed),
               failed_.load(std::memory_order_relaxed),
               dropped_.load(std::memory_order_relaxed)};
}

void Ticker::run(std::stop_token st) {
  SYSGRAPH_LOG_INFO("ticker", "sampling every %lldms (%s mode)",
                    static_cast<long long>(interval_.count()), mode_name(layout_.mode()));
  // First tick fires immediately so the dashboard has data on first load
  auto next = steady_clock::now();
  while (!st.stop_requested()) {
    {
      std::unique_lock<std::mutex> lk(wait_mu_);
      // Wakes early only when stop is requested
      wait_cv_.wait_until(lk, st, next, []{ return false; });
    }
    if (st.stop_requested()) break;

    (void)tick();

    next += interval_;
    auto now = steady_clock::now();
    if (now >= next) {
      auto missed = static_cast<uint64_t>((now - next) / interval_) + 1;
      next += interval_ * static_cast<int64_t>(missed);
      dropped_.fetch_add(missed, std::memory_order_relaxed);
      SYSGRAPH_LOG_WARN("ticker", "tick overran its %lldms slot; dropped %llu late tick(s)",
                        static_cast<long long>(interval_.count()),
                        static_cast<unsigned long long>(missed));
    }
  }
}

} // namespace sysgraph::app
