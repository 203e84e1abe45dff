#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace selfaudit::model {

enum class SnapshotStatus { Active, Archived };

struct SnapshotInfo {
  std::string name;
  std::filesystem::file_time_type timestamp{};  // directory mtime
  uint64_t size_bytes{};
  SnapshotStatus status{SnapshotStatus::Active};
  std::filesystem::path path;
};

} // namespace selfaudit::model
