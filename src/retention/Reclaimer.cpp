#include "retention/Reclaimer.hpp"

#include <cstdio>

#include "util/FileIO.hpp"
#include "util/Format.hpp"
#include "util/Glob.hpp"
#include "util/Storage.hpp"
#include "util/TomlReader.hpp"

namespace selfaudit::retention {

namespace fs = std::filesystem;

Reclaimer::Reclaimer(bool verbose, StorageProbe probe)
    : verbose_(verbose),
      patterns_{
        {"selfaudit-*", "selfaudit temporary files", true},
        {"checkpoint-*", "Checkpoint temporary files", true},
        {"test-*", "Test temporary files", true},
        {"*.tmp", "Generic temporary files", true},
      },
      base_dir_(engine::default_scratch_dir()),
      probe_(probe ? std::move(probe) : StorageProbe(util::storage_used_pct)) {}

void Reclaimer::register_workspace(std::shared_ptr<engine::Workspace> ws) {
  if (ws) workspaces_.push_back(std::move(ws));
}

void Reclaimer::add_custom_pattern(const std::string& pattern, const std::string& description) {
  patterns_.push_back(CleanupPattern{.pattern = pattern, .description = description, .enabled = true});
}

bool Reclaimer::load_config(const fs::path& path, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;
  util::TomlReader tr;
  if (!tr.load(path.string())) {
    err = "failed to read config file: " + path.string();
    return false;
  }
  CleanupConfig cfg;
  if (const auto* sec = tr.section("cleanup")) {
    cfg.storage_threshold = sec->get_double("storage_threshold", cfg.storage_threshold);
    cfg.max_retention_days = sec->get_int("max_retention_days", cfg.max_retention_days);
    cfg.exclude_patterns = sec->get_array("exclude_patterns");
  }
  for (const auto& t : tr.tables("cleanup.custom_patterns")) {
    cfg.custom_patterns.push_back(CleanupPattern{
      .pattern = t.get_string("pattern"),
      .description = t.get_string("description"),
      .enabled = t.get_bool("enabled", false),
    });
  }
  config_ = std::move(cfg);
  for (const auto& p : config_.custom_patterns) {
    if (p.enabled) add_custom_pattern(p.pattern, p.description);
  }
  return true;
}

bool Reclaimer::validate_patterns(std::string& err) const {
  std::string why;
  for (const auto& p : patterns_) {
    if (!util::glob_valid(p.pattern, why)) {
      err = "invalid pattern \"" + p.pattern + "\": " + why;
      return false;
    }
  }
  for (const auto& p : config_.exclude_patterns) {
    if (!util::glob_valid(p, why)) {
      err = "invalid exclude pattern \"" + p + "\": " + why;
      return false;
    }
  }
  return true;
}

bool Reclaimer::should_clean(const std::string& name) const {
  bool matched = false;
  for (const auto& p : patterns_) {
    if (p.enabled && util::glob_match(p.pattern, name)) { matched = true; break; }
  }
  if (!matched) return false;
  for (const auto& ex : config_.exclude_patterns) {
    if (util::glob_match(ex, name)) return false;
  }
  return true;
}

double Reclaimer::storage_usage() const {
  auto v = probe_(base_dir_);
  return v ? *v : 0.0;
}

bool Reclaimer::check_storage_usage(double threshold_pct, double& usage) const {
  usage = storage_usage();
  return usage > threshold_pct;
}

bool Reclaimer::should_trigger(double threshold_pct, bool force, double& usage) const {
  bool over = check_storage_usage(threshold_pct, usage);
  return over || force || dry_run_;
}

void Reclaimer::process_workspace(engine::Workspace& ws, CleanupResult& result) {
  if (!ws.is_disk() || ws.disposed()) return;
  const auto& root = ws.root();
  uint64_t size = 0;
  std::string err;
  if (util::dir_size(root, size, err)) result.space_freed += size;

  if (verbose_) {
    std::printf("%s workspace: %s\n", dry_run_ ? "Would remove" : "Removing",
                util::sanitize_output(root.string()).c_str());
  }
  if (dry_run_) {
    ++result.dirs_removed;
    return;
  }
  if (!ws.cleanup(err)) {
    result.errors.push_back("Failed to cleanup workspace " + root.string() + ": " + err);
    return;
  }
  ++result.dirs_removed;
}

void Reclaimer::process_entry(const fs::directory_entry& entry, CleanupResult& result) {
  auto name = entry.path().filename().string();
  if (!should_clean(name)) return;

  std::error_code ec;
  bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
  uint64_t size = 0;
  std::string err;
  if (is_dir) {
    if (util::dir_size(entry.path(), size, err)) result.space_freed += size;
  } else if (entry.is_regular_file(ec)) {
    auto sz = entry.file_size(ec);
    if (!ec) result.space_freed += sz;
  }

  if (verbose_) {
    std::printf("%s: %s\n", dry_run_ ? "Would remove" : "Removing",
                util::sanitize_output(entry.path().string()).c_str());
  }
  if (!dry_run_) {
    fs::remove_all(entry.path(), ec);
    if (ec) {
      result.errors.push_back("Failed to remove " + entry.path().string() + ": " + ec.message());
      return;
    }
  }
  if (is_dir) ++result.dirs_removed; else ++result.files_removed;
}

bool Reclaimer::cleanup_temporary_files(CleanupResult& result, std::string& err) {
  auto start = std::chrono::steady_clock::now();
  result = CleanupResult{};
  result.dry_run = dry_run_;
  result.storage_usage_before = storage_usage();
  if (verbose_) {
    std::printf("Starting temporary file cleanup%s...\n", dry_run_ ? " (DRY RUN)" : "");
    std::printf("Storage usage before cleanup: %.1f%%\n", result.storage_usage_before);
  }

  for (auto& ws : workspaces_) process_workspace(*ws, result);
  if (!dry_run_) workspaces_.clear();

  std::error_code ec;
  fs::directory_iterator it(base_dir_, ec);
  if (ec) {
    err = "failed to read " + base_dir_.string() + " directory: " + ec.message();
    return false;
  }
  for (const auto& entry : it) process_entry(entry, result);

  result.storage_usage_after = dry_run_ ? result.storage_usage_before : storage_usage();
  result.duration = std::chrono::steady_clock::now() - start;
  if (verbose_) {
    std::printf("Cleanup completed in %s\n", util::format_duration(result.duration).c_str());
  }
  return true;
}

bool Reclaimer::preview(CleanupResult& result, std::string& err) {
  bool prev = dry_run_;
  dry_run_ = true;
  bool ok = cleanup_temporary_files(result, err);
  dry_run_ = prev;
  return ok;
}

void Reclaimer::print_summary(const CleanupResult& result) const {
  if (result.dry_run) {
    std::printf("\n=== Cleanup Preview (DRY RUN) ===\n");
    std::printf("Files that would be removed: %d\n", result.files_removed);
    std::printf("Directories that would be removed: %d\n", result.dirs_removed);
    std::printf("Estimated space freed: %s\n", util::format_bytes(result.space_freed).c_str());
  } else {
    std::printf("\n=== Cleanup Summary ===\n");
    std::printf("Files removed: %d\n", result.files_removed);
    std::printf("Directories removed: %d\n", result.dirs_removed);
    std::printf("Space freed: %s\n", util::format_bytes(result.space_freed).c_str());
    std::printf("Storage usage: %.1f%% -> %.1f%%\n", result.storage_usage_before, result.storage_usage_after);
  }
  std::printf("Duration: %s\n", util::format_duration(result.duration).c_str());
  if (!result.errors.empty()) {
    std::printf("Errors: %zu\n", result.errors.size());
    for (const auto& e : result.errors) std::printf("  - %s\n", util::sanitize_output(e).c_str());
  }
}

} // namespace selfaudit::retention
