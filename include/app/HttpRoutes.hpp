#pragma once
#include <string>
#include <string_view>
#include "app/HistoryStore.hpp"
#include "app/Ticker.hpp"

namespace sysgraph::app {

struct HttpResponse {
  int status{200};
  const char* reason{"OK"};
  std::string content_type{"text/plain"};
  std::string body;
};

// Map an HTTP request line ("GET /charts HTTP/1.1") to a response.
// Reads only: Ticker::latest() and HistoryStore::snapshot().
[[nodiscard]] HttpResponse route_request(std::string_view request_line,
                                         const Ticker& ticker, const HistoryStore& store);

// Status line and headers including the blank line; Connection: close.
[[nodiscard]] std::string response_head(const HttpResponse& r);

} // namespace sysgraph::app
