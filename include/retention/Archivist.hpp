#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "model/SnapshotInfo.hpp"

namespace selfaudit::retention {

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct ArchiveCleanupResult {
  std::vector<std::string> removed;  // bucket names, e.g. "2024-01"
  std::vector<std::string> errors;
};

// Owns the artifact tree:
//   <root>/active/latest        findings of the most recent run
//   <root>/active/snapshots/N   timestamped copies of latest
//   <root>/archive/YYYY-MM/N    snapshots rotated out of active
class Archivist {
public:
  explicit Archivist(std::filesystem::path root, Clock clock = {});

  [[nodiscard]] std::filesystem::path latest_dir() const { return root_ / "active" / "latest"; }
  [[nodiscard]] std::filesystem::path snapshots_dir() const { return root_ / "active" / "snapshots"; }
  [[nodiscard]] std::filesystem::path archive_dir() const { return root_ / "archive"; }

  // Copies latest into snapshots/<name>; an empty name becomes
  // snapshot_<YYYY-MM-DD_HH-MM-SS>. Latest is left in place.
  [[nodiscard]] bool create_snapshot(const std::string& name, std::string& err);
  [[nodiscard]] bool create_snapshot(const std::string& name, std::filesystem::path& created, std::string& err);

  // Keeps the max_active newest snapshots (by name) and moves the rest to
  // archive/<current YYYY-MM>.
  [[nodiscard]] bool archive_old_snapshots(int max_active, std::string& err);

  // Removes archive buckets whose month began before now - retention_months.
  [[nodiscard]] bool cleanup_archives(int retention_months, ArchiveCleanupResult& result, std::string& err);

  [[nodiscard]] bool get_active_snapshots(std::vector<model::SnapshotInfo>& out, std::string& err) const;

private:
  std::filesystem::path root_;
  Clock clock_;
};

// Parses a strict "YYYY-MM" bucket name (month 01..12).
[[nodiscard]] bool parse_bucket_name(const std::string& name, int& year, unsigned& month);

} // namespace selfaudit::retention
