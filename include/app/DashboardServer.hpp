#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>
#include "app/HistoryStore.hpp"
#include "app/Ticker.hpp"

namespace sysgraph::app {

// Serves chart payloads and history over HTTP on its own thread, so the
// blocking CPU read on the tick thread never stalls request handling.
class DashboardServer {
public:
  DashboardServer(const Ticker& ticker, const HistoryStore& store,
                  std::string bind_addr, uint16_t port);
  ~DashboardServer();
  DashboardServer(const DashboardServer&) = delete;
  DashboardServer& operator=(const DashboardServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const Ticker& ticker_;
  const HistoryStore& store_;
  std::string bind_addr_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace sysgraph::app
