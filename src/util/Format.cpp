#include "util/Format.hpp"

#include <cstdio>

namespace selfaudit::util {

std::string sanitize_output(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c < 0x20 || c == 0x7f) out.push_back('?');
    else out.push_back(static_cast<char>(c));
  }
  return out;
}

std::string format_bytes(uint64_t bytes) {
  constexpr uint64_t unit = 1024;
  char buf[32];
  if (bytes < unit) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    return buf;
  }
  uint64_t div = unit;
  int exp = 0;
  for (uint64_t n = bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    ++exp;
  }
  static constexpr char units[] = "KMGTPE";
  std::snprintf(buf, sizeof(buf), "%.1f %cB", static_cast<double>(bytes) / static_cast<double>(div), units[exp]);
  return buf;
}

std::string format_duration(std::chrono::steady_clock::duration d) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  char buf[32];
  if (ms < 1000) std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(ms));
  else std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(ms) / 1000.0);
  return buf;
}

std::tm local_tm(std::chrono::system_clock::time_point t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm lt{};
  localtime_r(&tt, &lt);
  return lt;
}

std::string format_local_time(std::chrono::system_clock::time_point t, const char* fmt) {
  std::tm lt = local_tm(t);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return std::string();
  return std::string(buf);
}

} // namespace selfaudit::util
