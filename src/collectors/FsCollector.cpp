#include "collectors/FsCollector.hpp"

#include <sys/statvfs.h>

namespace sysgraph::collectors {

static uint64_t to_bytes(unsigned long long v) { return static_cast<uint64_t>(v); }

bool FsCollector::sample(const std::string& path, sysgraph::model::FsUsage& out) const {
  struct statvfs vfs{};
  if (::statvfs(path.c_str(), &vfs) != 0) return false;
  uint64_t total = to_bytes(vfs.f_blocks) * vfs.f_frsize;
  uint64_t free  = to_bytes(vfs.f_bfree) * vfs.f_frsize;
  uint64_t avail = to_bytes(vfs.f_bavail) * vfs.f_frsize;
  if (total == 0) return false;
  uint64_t used = (total > free) ? (total - free) : 0ULL;
  // Percent of the space usable by unprivileged users (excludes root reserve)
  uint64_t usable = used + avail;
  out.path = path;
  out.total_bytes = total;
  out.used_bytes = used;
  out.avail_bytes = avail;
  out.used_pct = (usable > 0) ? (100.0 * static_cast<double>(used) / static_cast<double>(usable)) : 0.0;
  return true;
}

} // namespace sysgraph::collectors
