#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace sysgraph::collectors {

static bool parse_cpu_line(std::string_view line, sysgraph::model::CpuTimes& out) {
  // skip label
  size_t pos = line.find(' ');
  if (pos == std::string_view::npos) return false;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end == start) break;
    std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end;
  }
  // user nice system idle are present on every kernel we care about
  if (i < 4) return false;
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  return true;
}

bool CpuCollector::sample(sysgraph::model::CpuTimes& out) const {
  auto txt_opt = sysgraph::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) return parse_cpu_line(line, out);
    start = end + 1;
  }
  return false;
}

std::optional<double> CpuCollector::usage_between(const sysgraph::model::CpuTimes& before,
                                                  const sysgraph::model::CpuTimes& after) {
  if (after.total() < before.total() || after.work() < before.work()) return std::nullopt;
  auto td = after.total() - before.total();
  auto wd = after.work() - before.work();
  if (td == 0) return 0.0; // no jiffies elapsed: report idle
  double pct = 100.0 * static_cast<double>(wd) / static_cast<double>(td);
  return pct > 100.0 ? 100.0 : pct;
}

} // namespace sysgraph::collectors
