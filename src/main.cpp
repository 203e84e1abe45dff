#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <cstdlib>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "app/Config.hpp"
#include "engine/Runner.hpp"
#include "engines/DocGapScanner.hpp"
#include "engines/MarkerScanner.hpp"
#include "flags/FlagSystem.hpp"
#include "report/Report.hpp"
#include "retention/Archivist.hpp"
#include "retention/Reclaimer.hpp"
#include "util/Format.hpp"

namespace fs = std::filesystem;
using namespace selfaudit;

static std::atomic<bool> g_interrupted{false};
static void on_sigint(int) { g_interrupted.store(true); }

struct Options {
  std::string root;
  std::string config;
  std::string help_command;
  bool verbose{false};
  bool dry_run{false};
  bool cleanup_only{false};
  bool archive_only{false};
  bool no_cleanup{false};
  bool force{false};
  int timeout_secs{0};
  double threshold{-1.0};  // < 0 keeps the configured value
};

static void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: selfaudit [options]\n"
    "  --root DIR            project root to audit (default: .)\n"
    "  --config FILE         configuration file\n"
    "  --help-command CMD    command that prints the audited program's help text\n"
    "  --timeout S           stop analysis after S seconds\n"
    "  --verbose             log progress to stderr\n"
    "  --dry-run             preview cleanup without removing anything\n"
    "  --cleanup-only        only reclaim temporary files\n"
    "  --archive-only        only snapshot, archive and expire artifacts\n"
    "  --no-cleanup          skip the final temporary file cleanup\n"
    "  --threshold PCT       storage usage percent that triggers cleanup\n"
    "  --force               clean up even when usage is below the threshold\n"
    "  -h, --help            show this help\n");
}

// 0 ok, 1 exit with success (help printed), 2 usage error
static int parse_args(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::string& dst) {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "selfaudit: option %s requires a value\n", a.c_str());
        return false;
      }
      dst = argv[++i];
      return true;
    };
    if (a == "-h" || a == "--help") { print_usage(stdout); return 1; }
    else if (a == "--root") { if (!value(o.root)) return 2; }
    else if (a == "--config") { if (!value(o.config)) return 2; }
    else if (a == "--help-command") { if (!value(o.help_command)) return 2; }
    else if (a == "--timeout") {
      std::string v;
      if (!value(v)) return 2;
      char* end = nullptr;
      long n = std::strtol(v.c_str(), &end, 10);
      if (*end != '\0' || n < 0) {
        std::fprintf(stderr, "selfaudit: invalid --timeout value: %s\n", v.c_str());
        return 2;
      }
      o.timeout_secs = static_cast<int>(n);
    }
    else if (a == "--threshold") {
      std::string v;
      if (!value(v)) return 2;
      char* end = nullptr;
      double pct = std::strtod(v.c_str(), &end);
      if (v.empty() || *end != '\0' || !(pct >= 0.0 && pct <= 100.0)) {
        std::fprintf(stderr, "selfaudit: invalid --threshold value: %s\n", util::sanitize_output(v).c_str());
        return 2;
      }
      o.threshold = pct;
    }
    else if (a == "--force") o.force = true;
    else if (a == "--verbose") o.verbose = true;
    else if (a == "--dry-run") o.dry_run = true;
    else if (a == "--cleanup-only") o.cleanup_only = true;
    else if (a == "--archive-only") o.archive_only = true;
    else if (a == "--no-cleanup") o.no_cleanup = true;
    else {
      std::fprintf(stderr, "selfaudit: unknown option: %s\n", util::sanitize_output(a).c_str());
      print_usage(stderr);
      return 2;
    }
  }
  if (o.cleanup_only && o.archive_only) {
    std::fprintf(stderr, "selfaudit: --cleanup-only and --archive-only are mutually exclusive\n");
    return 2;
  }
  return 0;
}

static bool run_cleanup(retention::Reclaimer& reclaimer) {
  retention::CleanupResult result;
  std::string err;
  if (!reclaimer.cleanup_temporary_files(result, err)) {
    std::fprintf(stderr, "selfaudit: Reclaimer: %s\n", util::sanitize_output(err).c_str());
    return false;
  }
  reclaimer.print_summary(result);
  return true;
}

// Standalone cleanup: skipped while usage stays at or below the threshold
static bool run_gated_cleanup(retention::Reclaimer& reclaimer, double threshold, bool force) {
  double usage = 0.0;
  bool go = reclaimer.should_trigger(threshold, force, usage);
  std::printf("Current storage usage: %.1f%%\n", usage);
  if (!go) {
    std::printf("Storage usage (%.1f%%) is below threshold (%.1f%%). Use --force to cleanup anyway.\n", usage,
                threshold);
    return true;
  }
  if (reclaimer.dry_run()) std::printf("DRY RUN MODE - No files will be actually removed\n");
  else if (usage > threshold)
    std::printf("Storage usage (%.1f%%) exceeds threshold (%.1f%%). Starting cleanup...\n", usage, threshold);
  else std::printf("Force cleanup requested...\n");
  return run_cleanup(reclaimer);
}

static bool run_retention(const app::Config& cfg) {
  retention::Archivist archivist(cfg.archive.root);
  std::string err;
  fs::path created;
  if (!archivist.create_snapshot("", created, err)) {
    std::fprintf(stderr, "selfaudit: Archivist: %s\n", util::sanitize_output(err).c_str());
    return false;
  }
  std::printf("Snapshot created: %s\n", util::sanitize_output(created.string()).c_str());
  if (!archivist.archive_old_snapshots(cfg.archive.max_active, err)) {
    std::fprintf(stderr, "selfaudit: Archivist: %s\n", util::sanitize_output(err).c_str());
    return false;
  }
  retention::ArchiveCleanupResult expired;
  if (!archivist.cleanup_archives(cfg.archive.retention_months, expired, err)) {
    std::fprintf(stderr, "selfaudit: Archivist: %s\n", util::sanitize_output(err).c_str());
    return false;
  }
  for (const auto& b : expired.removed) std::printf("Expired archive: %s\n", b.c_str());
  for (const auto& e : expired.errors) std::fprintf(stderr, "selfaudit: Archivist: %s\n", util::sanitize_output(e).c_str());
  return true;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);

  Options opt;
  if (int rc = parse_args(argc, argv, opt); rc != 0) return rc == 1 ? 0 : rc;

  app::Config cfg;
  std::string err;
  if (!app::load_config(opt.config, cfg, err)) {
    std::fprintf(stderr, "selfaudit: %s\n", util::sanitize_output(err).c_str());
    return 2;
  }
  if (!opt.root.empty()) cfg.run.root = opt.root;
  if (!opt.help_command.empty()) cfg.flags.help_command = opt.help_command;
  if (opt.verbose) cfg.run.verbose = true;
  if (opt.no_cleanup) cfg.cleanup.skip = true;
  if (opt.threshold >= 0.0) cfg.cleanup.storage_threshold = opt.threshold;

  retention::Reclaimer reclaimer(cfg.run.verbose);
  reclaimer.set_dry_run(opt.dry_run);
  if (cfg.from_file && !reclaimer.load_config(cfg.path, err)) {
    std::fprintf(stderr, "selfaudit: Reclaimer: %s\n", util::sanitize_output(err).c_str());
    return 2;
  }
  if (!reclaimer.validate_patterns(err)) {
    std::fprintf(stderr, "selfaudit: Reclaimer: %s\n", util::sanitize_output(err).c_str());
    return 2;
  }

  if (opt.cleanup_only) return run_gated_cleanup(reclaimer, cfg.cleanup.storage_threshold, opt.force) ? 0 : 1;
  if (opt.archive_only) return run_retention(cfg) ? 0 : 1;

  double usage = 0.0;
  if (reclaimer.check_storage_usage(cfg.cleanup.storage_threshold, usage)) {
    std::printf("Warning: Storage usage is %.1f%%. Consider running cleanup before analysis.\n", usage);
  }

  // Ctrl+C requests a cooperative stop; engines notice it between work items
  std::stop_source stop;
  std::jthread watcher([&stop](std::stop_token st) {
    while (!st.stop_requested()) {
      if (g_interrupted.load()) { stop.request_stop(); return; }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });
  engine::AnalysisContext ctx{.stop = stop.get_token()};
  if (opt.timeout_secs > 0) ctx.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opt.timeout_secs);

  std::shared_ptr<flags::IHelpTextRenderer> help;
  if (!cfg.flags.help_command.empty()) help = std::make_shared<flags::CommandHelpText>(cfg.flags.help_command);
  auto flag_system = std::make_shared<flags::FlagSystem>(cfg.flags, nullptr, help);
  flag_system->set_verbose(cfg.run.verbose);

  std::vector<std::shared_ptr<engine::IAnalysisEngine>> all_engines{
    std::make_shared<engines::MarkerScanner>(),
    std::make_shared<engines::DocGapScanner>(nullptr, cfg.flags.source_extensions),
    flag_system,
  };

  std::printf("Running project analysis on %s...\n", util::sanitize_output(cfg.run.root).c_str());
  engine::Runner runner(all_engines, engine::default_workspace_factory(engine::default_scratch_dir()), &reclaimer);
  runner.set_verbose(cfg.run.verbose);
  bool ok = runner.run(ctx, cfg.run.root, err);
  watcher.request_stop();
  if (!ok) std::fprintf(stderr, "selfaudit: %s\n", util::sanitize_output(err).c_str());

  auto issues = runner.issues();
  report::sort_issues(issues);
  const auto& flag_list = flag_system->last_flags();

  retention::Archivist archivist(cfg.archive.root);
  if (!report::write_latest(archivist.latest_dir(),
                            {
                              {"findings_summary.md", report::render_summary(issues)},
                              {"findings_flag_report.md", report::render_flag_report(flag_list)},
                              {"findings_issues.csv", report::render_issues_csv(issues)},
                            },
                            err)) {
    std::fprintf(stderr, "selfaudit: saving reports: %s\n", util::sanitize_output(err).c_str());
    ok = false;
  } else {
    std::printf("Analysis complete: %zu issues, %zu flags. Reports in %s\n", issues.size(), flag_list.size(),
                util::sanitize_output(archivist.latest_dir().string()).c_str());
    if (!run_retention(cfg)) ok = false;
  }

  if (!cfg.cleanup.skip) {
    std::printf("Performing post-analysis cleanup...\n");
    if (!run_cleanup(reclaimer)) std::fprintf(stderr, "selfaudit: Warning: cleanup failed\n");
  }
  return ok ? 0 : 1;
}
