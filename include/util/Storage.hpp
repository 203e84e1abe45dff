#pragma once
#include <filesystem>
#include <optional>

namespace selfaudit::util {

// Used percentage (0..100) of the filesystem holding p, from statvfs.
// used = total - available-to-unprivileged, as df reports it.
auto storage_used_pct(const std::filesystem::path& p) -> std::optional<double>;

} // namespace selfaudit::util
