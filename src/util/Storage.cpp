#include "util/Storage.hpp"

#include <sys/statvfs.h>
#include <cstdint>

namespace selfaudit::util {

static uint64_t to_bytes(unsigned long long v) { return static_cast<uint64_t>(v); }

auto storage_used_pct(const std::filesystem::path& p) -> std::optional<double> {
  struct statvfs vfs{};
  if (::statvfs(p.c_str(), &vfs) != 0) return std::nullopt;
  uint64_t total = to_bytes(vfs.f_blocks) * vfs.f_frsize;
  uint64_t avail = to_bytes(vfs.f_bavail) * vfs.f_frsize;
  uint64_t used = (total > avail) ? (total - avail) : 0ULL;
  if (total == 0) return 0.0;
  return 100.0 * static_cast<double>(used) / static_cast<double>(total);
}

} // namespace selfaudit::util
