#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace selfaudit::util {

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::filesystem::path& p) -> std::optional<std::string>;

// Recursive sum of regular file sizes below p (p itself may be a file).
// Symlinks are not followed. Returns false and sets err if p cannot be walked.
[[nodiscard]] bool dir_size(const std::filesystem::path& p, uint64_t& bytes, std::string& err);

// Write bytes to p, replacing any previous content.
[[nodiscard]] bool write_file_string(const std::filesystem::path& p, const std::string& content, std::string& err);

} // namespace selfaudit::util
