#include "app/ChartLayout.hpp"
#include "app/Config.hpp"
#include "app/DashboardServer.hpp"
#include "app/HistoryStore.hpp"
#include "app/StatsSampler.hpp"
#include "app/Ticker.hpp"
#include "collectors/ProcStatsProvider.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: sysgraph [one|multiple] [--port N] [--bind ADDR] [--config PATH] [--ticks N]\n";
  std::cout << "  one        single chart with RAM, CPU and Disk series\n";
  std::cout << "  multiple   one chart per metric (default)\n";
  std::cout << "Samples every 5s; serves /charts and /history over HTTP. Ctrl+C to exit.\n";
}

static bool parse_int_arg(const char* s, int& out) {
  try { out = std::stoi(s); return true; } catch (const std::exception&) { return false; }
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::optional<std::string> mode_arg;
  std::optional<int> port_arg;
  std::optional<std::string> bind_arg;
  std::string config_path;
  int ticks = 0; // 0 => run until signalled
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else if (a == "--port" && i + 1 < argc) {
      int p = 0;
      if (!parse_int_arg(argv[++i], p) || p < 1 || p > 65535) {
        std::cerr << "sysgraph: invalid --port value\n";
        return 2;
      }
      port_arg = p;
    }
    else if (a == "--bind" && i + 1 < argc) bind_arg = argv[++i];
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--ticks" && i + 1 < argc) {
      if (!parse_int_arg(argv[++i], ticks) || ticks < 0) {
        std::cerr << "sysgraph: invalid --ticks value\n";
        return 2;
      }
    }
    else if (!a.starts_with("-") && !mode_arg) mode_arg = a;
    else {
      std::cerr << "sysgraph: unrecognized argument '" << a << "'\n";
      print_usage();
      return 2;
    }
  }

  auto cfg_or = sysgraph::app::load_config(config_path);
  if (!cfg_or) {
    SYSGRAPH_LOG_ERROR("main", "%s", cfg_or.error().c_str());
    return 1;
  }
  auto cfg = *cfg_or;
  if (mode_arg) cfg.mode = sysgraph::app::parse_mode(*mode_arg);
  if (port_arg) cfg.port = *port_arg;
  if (bind_arg) cfg.bind = *bind_arg;
  sysgraph::util::set_log_level(cfg.log_level);
  if (!cfg.source.empty()) SYSGRAPH_LOG_INFO("main", "loaded config %s", cfg.source.c_str());

  // Owned here; the tick thread writes, the server thread reads
  sysgraph::app::HistoryStore store;
  sysgraph::collectors::ProcStatsProvider provider;
  sysgraph::app::SamplerOptions sopts;
  sopts.disk_path = cfg.disk_path;
  sopts.cpu_window = std::chrono::milliseconds(cfg.cpu_window_ms);
  sysgraph::app::StatsSampler sampler(provider, sopts);
  auto layout = sysgraph::app::make_layout(cfg.mode);

  SYSGRAPH_LOG_INFO("main", "%s", sysgraph::app::page_title(cfg.mode));

  sysgraph::app::Ticker ticker(sampler, store, *layout);
  sysgraph::app::DashboardServer server(ticker, store, cfg.bind, static_cast<uint16_t>(cfg.port));
  server.start();
  ticker.start();

  while (!g_stop.load()) {
    if (ticks > 0 && ticker.stats().ticks >= static_cast<uint64_t>(ticks) &&
        ticker.state() == sysgraph::app::Ticker::State::Idle) break;
    std::this_thread::sleep_for(50ms);
  }

  ticker.stop();
  server.stop();
  auto st = ticker.stats();
  SYSGRAPH_LOG_INFO("main", "exiting after %llu tick(s), %llu failed, %llu dropped; %zu sample(s) held",
                    static_cast<unsigned long long>(st.ticks), static_cast<unsigned long long>(st.failed),
                    static_cast<unsigned long long>(st.dropped), store.size());
  return 0;
}
