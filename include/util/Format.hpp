#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace selfaudit::util {

// Replace control characters (terminal escapes included) with '?' so that
// names read from disk are safe to print.
[[nodiscard]] auto sanitize_output(std::string_view text) -> std::string;

// 1023 -> "1023 B", 1536 -> "1.5 KB", ...
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

// "850ms", "2.4s"
[[nodiscard]] auto format_duration(std::chrono::steady_clock::duration d) -> std::string;

// Broken-down local time for t.
[[nodiscard]] auto local_tm(std::chrono::system_clock::time_point t) -> std::tm;

// strftime of t in local time; empty on overflow of the internal buffer.
[[nodiscard]] auto format_local_time(std::chrono::system_clock::time_point t, const char* fmt) -> std::string;

} // namespace selfaudit::util
