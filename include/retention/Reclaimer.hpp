#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/Workspace.hpp"

namespace selfaudit::retention {

struct CleanupPattern {
  std::string pattern;
  std::string description;
  bool enabled{true};
};

struct CleanupConfig {
  double storage_threshold{75.0};
  int max_retention_days{7};  // informational
  std::vector<CleanupPattern> custom_patterns;
  std::vector<std::string> exclude_patterns;
};

struct CleanupResult {
  int files_removed{0};
  int dirs_removed{0};
  uint64_t space_freed{0};
  std::vector<std::string> errors;
  std::chrono::steady_clock::duration duration{};
  double storage_usage_before{0.0};
  double storage_usage_after{0.0};
  bool dry_run{false};
};

// Percentage of storage in use for the filesystem holding a path.
using StorageProbe = std::function<std::optional<double>(const std::filesystem::path&)>;

// Removes tracked workspaces and stale temporary entries from a base directory.
class Reclaimer {
public:
  explicit Reclaimer(bool verbose = false, StorageProbe probe = {});

  void register_workspace(std::shared_ptr<engine::Workspace> ws);
  void set_dry_run(bool enabled) { dry_run_ = enabled; }
  [[nodiscard]] bool dry_run() const { return dry_run_; }
  void set_base_dir(std::filesystem::path dir) { base_dir_ = std::move(dir); }
  [[nodiscard]] const std::filesystem::path& base_dir() const { return base_dir_; }
  void add_custom_pattern(const std::string& pattern, const std::string& description);

  // Reads the [cleanup] section. A missing file leaves everything as is.
  [[nodiscard]] bool load_config(const std::filesystem::path& path, std::string& err);
  [[nodiscard]] const CleanupConfig& config() const { return config_; }
  [[nodiscard]] const std::vector<CleanupPattern>& patterns() const { return patterns_; }
  [[nodiscard]] size_t tracked_workspaces() const { return workspaces_.size(); }

  [[nodiscard]] bool validate_patterns(std::string& err) const;

  // True when name matches an enabled pattern and no exclude pattern.
  [[nodiscard]] bool should_clean(const std::string& name) const;

  [[nodiscard]] bool cleanup_temporary_files(CleanupResult& result, std::string& err);
  [[nodiscard]] bool preview(CleanupResult& result, std::string& err);

  // True when current usage is strictly above threshold_pct.
  [[nodiscard]] bool check_storage_usage(double threshold_pct, double& usage) const;
  // check_storage_usage, overridden by force. Dry runs always proceed since they remove nothing.
  [[nodiscard]] bool should_trigger(double threshold_pct, bool force, double& usage) const;

  void print_summary(const CleanupResult& result) const;

private:
  bool verbose_{false};
  bool dry_run_{false};
  std::vector<CleanupPattern> patterns_;
  CleanupConfig config_;
  std::filesystem::path base_dir_;
  std::vector<std::shared_ptr<engine::Workspace>> workspaces_;
  StorageProbe probe_;

  [[nodiscard]] double storage_usage() const;
  void process_workspace(engine::Workspace& ws, CleanupResult& result);
  void process_entry(const std::filesystem::directory_entry& entry, CleanupResult& result);
};

} // namespace selfaudit::retention
