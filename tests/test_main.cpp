#include "minitest.hpp"
#include "util/Log.hpp"

int main() {
  // Sampler and ticker log on every call; keep test output readable
  sysgraph::util::set_log_level(sysgraph::util::LogLevel::Error);
  return mini::run_all();
}
