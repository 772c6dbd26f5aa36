#include "util/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace sysgraph::util {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

static const char* level_tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
  }
  return "info";
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

bool parse_log_level(std::string_view s, LogLevel& out) {
  std::string v(s);
  for (auto& c : v) c = static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  if (v == "error") { out = LogLevel::Error; return true; }
  if (v == "warn" || v == "warning") { out = LogLevel::Warn; return true; }
  if (v == "info") { out = LogLevel::Info; return true; }
  if (v == "debug") { out = LogLevel::Debug; return true; }
  return false;
}

void log(LogLevel lvl, const char* component, const char* fmt, ...) {
  if (static_cast<int>(lvl) > g_level.load(std::memory_order_relaxed)) return;
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);
  // Single write per line so concurrent threads do not interleave mid-line
  std::fprintf(stderr, "sysgraph: [%s] %s: %s\n", level_tag(lvl), component, msg);
}

} // namespace sysgraph::util
