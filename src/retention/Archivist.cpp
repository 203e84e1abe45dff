#include "retention/Archivist.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>

#include "util/FileIO.hpp"
#include "util/Format.hpp"

namespace selfaudit::retention {

namespace fs = std::filesystem;
namespace chr = std::chrono;

Archivist::Archivist(fs::path root, Clock clock)
    : root_(std::move(root)), clock_(clock ? std::move(clock) : Clock([]{ return chr::system_clock::now(); })) {}

bool Archivist::create_snapshot(const std::string& name, std::string& err) {
  fs::path created;
  return create_snapshot(name, created, err);
}

bool Archivist::create_snapshot(const std::string& name, fs::path& created, std::string& err) {
  auto base = snapshots_dir();
  std::string requested = name.empty()
      ? "snapshot_" + util::format_local_time(clock_(), "%Y-%m-%d_%H-%M-%S")
      : name;

  std::string clean = fs::path(requested).filename().string();
  if (clean.empty() || clean == "." || clean == "..") {
    err = "invalid snapshot name: " + requested;
    return false;
  }
  auto target = (base / clean).lexically_normal();
  auto rel = target.lexically_relative(base.lexically_normal());
  if (rel.empty() || rel.begin()->string() == ".." || rel.has_root_path()) {
    err = "invalid snapshot name: " + requested;
    return false;
  }

  std::error_code ec;
  auto latest = latest_dir();
  if (!fs::is_directory(latest, ec)) {
    err = "cannot create snapshot: latest findings directory missing: " + latest.string();
    return false;
  }
  if (fs::is_empty(latest, ec) || ec) {
    err = ec ? "cannot read " + latest.string() + ": " + ec.message()
             : "cannot create snapshot: latest findings directory is empty";
    return false;
  }
  if (fs::exists(target, ec)) {
    err = "snapshot already exists: " + clean;
    return false;
  }
  fs::create_directories(target, ec);
  if (ec) {
    err = "failed to create snapshot directory: " + ec.message();
    return false;
  }
  for (const auto& entry : fs::directory_iterator(latest, ec)) {
    auto dst = target / entry.path().filename();
    std::error_code cec;
    fs::copy(entry.path(), dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks, cec);
    if (cec) {
      err = "failed to copy " + entry.path().string() + ": " + cec.message();
      return false;
    }
  }
  if (ec) {
    err = "cannot read " + latest.string() + ": " + ec.message();
    return false;
  }
  created = target;
  return true;
}

// rename(2) cannot cross filesystems; fall back to copy + remove there.
static bool move_tree(const fs::path& from, const fs::path& to, std::string& err) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return true;
  if (ec != std::errc::cross_device_link) {
    err = "rename " + from.string() + " -> " + to.string() + ": " + ec.message();
    return false;
  }
  fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    err = "copy " + from.string() + " -> " + to.string() + ": " + ec.message();
    return false;
  }
  fs::remove_all(from, ec);
  if (ec) {
    err = "remove " + from.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool Archivist::archive_old_snapshots(int max_active, std::string& err) {
  if (max_active < 0) {
    err = "max_active must not be negative: " + std::to_string(max_active);
    return false;
  }
  auto snaps = snapshots_dir();
  std::error_code ec;
  if (!fs::exists(snaps, ec)) return true;

  std::vector<std::string> names;
  for (const auto& entry : fs::directory_iterator(snaps, ec)) {
    std::error_code dec;
    if (entry.is_directory(dec)) names.push_back(entry.path().filename().string());
  }
  if (ec) {
    err = "failed to read " + snaps.string() + " directory: " + ec.message();
    return false;
  }
  if (names.size() <= static_cast<size_t>(max_active)) return true;
  std::sort(names.begin(), names.end());

  auto bucket = archive_dir() / util::format_local_time(clock_(), "%Y-%m");
  fs::create_directories(bucket, ec);
  if (ec) {
    err = "failed to create archive directory " + bucket.string() + ": " + ec.message();
    return false;
  }
  size_t n_archive = names.size() - static_cast<size_t>(max_active);
  for (size_t i = 0; i < n_archive; ++i) {
    std::string why;
    if (!move_tree(snaps / names[i], bucket / names[i], why)) {
      err = "archiving snapshot " + names[i] + ": " + why;
      return false;
    }
  }
  return true;
}

bool parse_bucket_name(const std::string& name, int& year, unsigned& month) {
  if (name.size() != 7 || name[4] != '-') return false;
  for (size_t i = 0; i < name.size(); ++i) {
    if (i == 4) continue;
    if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
  }
  year = std::stoi(name.substr(0, 4));
  month = static_cast<unsigned>(std::stoi(name.substr(5, 2)));
  return month >= 1 && month <= 12;
}

// Local wall-clock instant expressed as seconds on a sys_days axis, so that
// bucket starts and the cutoff compare without a round trip through mktime.
static chr::sys_seconds local_seconds_of(const std::tm& t) {
  chr::year_month_day ymd{chr::year{t.tm_year + 1900}, chr::month{static_cast<unsigned>(t.tm_mon + 1)},
                          chr::day{static_cast<unsigned>(t.tm_mday)}};
  return chr::sys_days{ymd} + chr::hours{t.tm_hour} + chr::minutes{t.tm_min} + chr::seconds{t.tm_sec};
}

bool Archivist::cleanup_archives(int retention_months, ArchiveCleanupResult& result, std::string& err) {
  result = ArchiveCleanupResult{};
  auto dir = archive_dir();
  std::error_code ec;
  if (!fs::exists(dir, ec)) return true;

  // now - retention_months; a day past the end of the target month rolls
  // over into the next one (Mar 31 - 1 month = Mar 3 or Mar 2).
  std::tm now = util::local_tm(clock_());
  int months = (now.tm_year + 1900) * 12 + now.tm_mon - retention_months;
  std::tm cut = now;
  cut.tm_year = months / 12 - 1900;
  cut.tm_mon = months % 12;
  if (cut.tm_mon < 0) { cut.tm_mon += 12; cut.tm_year -= 1; }
  auto cutoff = local_seconds_of(cut);

  std::vector<fs::path> buckets;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    std::error_code dec;
    if (entry.is_directory(dec)) buckets.push_back(entry.path());
  }
  if (ec) {
    err = "failed to read " + dir.string() + " directory: " + ec.message();
    return false;
  }
  std::sort(buckets.begin(), buckets.end());
  for (const auto& b : buckets) {
    int y = 0;
    unsigned m = 0;
    auto name = b.filename().string();
    if (!parse_bucket_name(name, y, m)) continue;
    chr::sys_seconds start = chr::sys_days{chr::year{y} / chr::month{m} / chr::day{1}};
    if (!(start < cutoff)) continue;
    std::error_code rec;
    fs::remove_all(b, rec);
    if (rec) {
      result.errors.push_back("Failed to remove archive " + b.string() + ": " + rec.message());
      continue;
    }
    result.removed.push_back(name);
  }
  return true;
}

bool Archivist::get_active_snapshots(std::vector<model::SnapshotInfo>& out, std::string& err) const {
  out.clear();
  auto snaps = snapshots_dir();
  std::error_code ec;
  if (!fs::exists(snaps, ec)) return true;
  for (const auto& entry : fs::directory_iterator(snaps, ec)) {
    std::error_code dec;
    if (!entry.is_directory(dec)) continue;
    model::SnapshotInfo info{};
    info.name = entry.path().filename().string();
    info.path = entry.path();
    info.status = model::SnapshotStatus::Active;
    info.timestamp = fs::last_write_time(entry.path(), dec);
    if (dec) continue;
    std::string size_err;
    if (!util::dir_size(entry.path(), info.size_bytes, size_err)) {
      std::fprintf(stderr, "selfaudit: Archivist: %s\n", util::sanitize_output(size_err).c_str());
    }
    out.push_back(std::move(info));
  }
  if (ec) {
    err = "failed to read " + snaps.string() + " directory: " + ec.message();
    return false;
  }
  std::sort(out.begin(), out.end(), [](const model::SnapshotInfo& a, const model::SnapshotInfo& b) {
    if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
    return a.name < b.name;
  });
  return true;
}

} // namespace selfaudit::retention
