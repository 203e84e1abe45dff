#include "flags/FlagSystem.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_set>

#include "util/FileIO.hpp"
#include "util/Format.hpp"

namespace selfaudit::flags {

namespace fs = std::filesystem;
using model::FlagImplStatus;
using model::FlagStatus;

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return !needle.empty() && haystack.find(needle) != std::string::npos;
}

FlagSystem::FlagSystem(FlagLayout layout,
                       std::shared_ptr<source::ISourceModelProvider> provider,
                       std::shared_ptr<IHelpTextRenderer> help)
    : layout_(std::move(layout)),
      provider_(provider ? std::move(provider) : std::make_shared<source::TokenSourceModelProvider>()),
      help_(std::move(help)) {}

bool FlagSystem::locate_config_package(const fs::path& root, fs::path& dir, std::string& err) const {
  auto base = root / layout_.package_root;
  std::error_code ec;
  std::vector<fs::path> matches;
  if (fs::is_directory(base, ec)) {
    for (auto it = fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) break;
      std::error_code dec;
      if (it->is_directory(dec) && it->path().filename() == layout_.config_package) matches.push_back(it->path());
    }
  }
  if (matches.empty()) {
    err = "package " + layout_.config_package + " not found";
    return false;
  }
  auto depth = [](const fs::path& p) { return std::distance(p.begin(), p.end()); };
  std::sort(matches.begin(), matches.end(), [&](const fs::path& a, const fs::path& b) {
    if (depth(a) != depth(b)) return depth(a) < depth(b);
    return a < b;
  });
  dir = matches.front();
  return true;
}

bool FlagSystem::config_sources(const fs::path& root, std::vector<fs::path>& files, std::string& err) const {
  fs::path dir;
  if (!locate_config_package(root, dir, err)) return false;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    if (layout_.is_source_file(entry.path().filename().string())) files.push_back(entry.path());
  }
  if (ec) {
    err = "failed to read " + dir.string() + " directory: " + ec.message();
    return false;
  }
  std::sort(files.begin(), files.end());
  return true;
}

// fs.StringVarP(&cfg.X, "long", "s", def, "usage") or fs.StringVar(&cfg.X, "long", def, "usage")
bool FlagSystem::parse_registration(const source::Call& call, FlagStatus& out) const {
  bool registration = std::any_of(layout_.registration_suffixes.begin(), layout_.registration_suffixes.end(),
                                  [&](const std::string& s) { return ends_with(call.member, s); });
  if (!registration || call.args.size() < 3) return false;
  // bare StringVar(...) is not a flag-set method
  if (call.receiver.empty()) return false;

  const auto& args = call.args;
  if (args[1].is_string_literal) {
    out.long_form = args[1].text;
    out.name = out.long_form;
  }
  bool short_shape = !layout_.short_suffix.empty() && ends_with(call.member, layout_.short_suffix);
  if (short_shape && args.size() >= 4) {
    if (args[2].is_string_literal) out.short_form = args[2].text;
    if (args.size() >= 5 && args[4].is_string_literal) out.description = args[4].text;
  } else if (args.size() >= 4 && args[3].is_string_literal) {
    out.description = args[3].text;
  }
  return !out.name.empty();
}

bool FlagSystem::catalog(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace&,
                         std::vector<FlagStatus>& flags, std::string& err) {
  std::vector<fs::path> files;
  if (!config_sources(root, files, err)) return false;

  std::vector<FlagStatus> found;
  for (const auto& file : files) {
    if (ctx.cancelled()) {
      err = "cancelled";
      return false;
    }
    source::SourceModel model;
    std::string perr;
    if (!provider_->parse_file(file, model, perr)) {
      std::fprintf(stderr, "selfaudit: FlagSystem: skipping %s\n", util::sanitize_output(perr).c_str());
      continue;
    }
    for (const auto& call : model.calls) {
      FlagStatus st{};
      if (!parse_registration(call, st)) continue;
      st.defined_in_code = true;
      found.push_back(std::move(st));
    }
  }
  if (verbose_) std::fprintf(stderr, "selfaudit: FlagSystem: cataloged %zu flags\n", found.size());
  flags.insert(flags.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  return true;
}

bool FlagSystem::classify(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace&,
                          std::vector<FlagStatus>& flags, std::string& err) {
  std::vector<fs::path> files;
  if (!config_sources(root, files, err)) return false;

  std::string config_text;
  source::SourceModel config_model;
  for (const auto& file : files) {
    auto text = util::read_file_string(file);
    if (!text) {
      err = "cannot read " + file.string();
      return false;
    }
    std::string perr;
    if (!provider_->parse_text(*text, config_model, perr)) {
      std::fprintf(stderr, "selfaudit: FlagSystem: %s: %s\n", util::sanitize_output(file.string()).c_str(),
                   util::sanitize_output(perr).c_str());
    }
    config_text += *text;
  }

  // A missing entry point is an empty program, not an error
  source::SourceModel main_model;
  if (auto main_text = util::read_file_string(root / layout_.main_source)) {
    std::string perr;
    if (!provider_->parse_text(*main_text, main_model, perr)) {
      std::fprintf(stderr, "selfaudit: FlagSystem: %s: %s\n", layout_.main_source.c_str(),
                   util::sanitize_output(perr).c_str());
    }
  }

  std::string help_text;
  if (help_) {
    std::string herr;
    if (!help_->render(help_text, herr)) {
      std::fprintf(stderr, "selfaudit: FlagSystem: help text unavailable: %s\n", util::sanitize_output(herr).c_str());
      help_text.clear();
    }
  }

  for (auto& flag : flags) {
    if (ctx.cancelled()) {
      err = "cancelled";
      return false;
    }
    auto field = mapper_.map(flag.long_form);
    bool in_config = config_model.references(layout_.config_receivers, field) ||
                     contains(config_text, layout_.changed_call + flag.long_form + "\")");
    bool in_main = main_model.references(layout_.config_receivers, field);
    if (in_config && in_main) flag.status = FlagImplStatus::FullyImplemented;
    else if (in_config || in_main) flag.status = FlagImplStatus::PartiallyImplemented;
    else flag.status = FlagImplStatus::PlannedNotImplemented;

    auto marked = layout_.flag_marker + flag.long_form;
    if (contains(config_text, marked) || contains(help_text, marked)) flag.defined_in_help = true;
  }
  return true;
}

std::string FlagSystem::read_combined(const fs::path& root, const std::vector<std::string>& rel_paths) const {
  std::string out;
  for (const auto& rel : rel_paths) {
    if (auto text = util::read_file_string(root / rel)) {
      out += *text;
      out += '\n';
    }
  }
  return out;
}

std::vector<std::string> extract_flag_tokens(const std::string& text) {
  auto lower = [](char c) { return c >= 'a' && c <= 'z'; };
  auto tail = [&](char c) { return lower(c) || (c >= '0' && c <= '9') || c == '-'; };
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  // "--" then [a-z][a-z0-9-]+, scanned in one pass
  size_t pos = text.find("--");
  while (pos != std::string::npos) {
    size_t b = pos + 2;
    if (b >= text.size() || !lower(text[b])) {
      pos = text.find("--", pos + 1);
      continue;
    }
    size_t e = b + 1;
    while (e < text.size() && tail(text[e])) ++e;
    if (e - b >= 2) {
      std::string tok = text.substr(b, e - b);
      if (seen.insert(tok).second) out.push_back(std::move(tok));
    }
    pos = text.find("--", e);
  }
  return out;
}

bool FlagSystem::cross_reference(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace&,
                                 std::vector<FlagStatus>& flags, std::string& err) {
  std::string docs = read_combined(root, layout_.user_docs);
  std::string planning = read_combined(root, layout_.planning_docs);

  for (auto& flag : flags) {
    if (ctx.cancelled()) {
      err = "cancelled";
      return false;
    }
    auto marked = layout_.flag_marker + flag.long_form;
    if (contains(docs, marked)) flag.defined_in_docs = true;
    // The bare name also counts for planning documents
    if (contains(planning, marked) || contains(planning, flag.long_form)) flag.defined_in_planning = true;
  }

  for (const auto& ghost : extract_flag_tokens(planning)) {
    bool known = std::any_of(flags.begin(), flags.end(), [&](const FlagStatus& f) { return f.long_form == ghost; });
    if (known) continue;
    FlagStatus st{};
    st.name = ghost;
    st.long_form = ghost;
    st.defined_in_planning = true;
    st.status = FlagImplStatus::PlannedNotImplemented;
    flags.push_back(std::move(st));
  }
  return true;
}

void FlagSystem::detect_conflicts(std::vector<FlagStatus>& flags) const {
  using model::ConflictSeverity;
  using model::ConflictType;
  for (auto& flag : flags) {
    if (flag.defined_in_code && !flag.defined_in_help && !flag.defined_in_docs) {
      flag.conflicts.push_back(model::FlagConflict{
        .type = ConflictType::OrphanedFlag,
        .source1 = "code",
        .source2 = "documentation",
        .description = "Flag is implemented in code but missing from help text and user documentation.",
        .severity = ConflictSeverity::ConflictHigh,
      });
    }
    if (flag.defined_in_code && !flag.defined_in_docs && !flag.has_conflict(ConflictType::OrphanedFlag)) {
      flag.conflicts.push_back(model::FlagConflict{
        .type = ConflictType::DescriptionConflict,
        .source1 = "code",
        .source2 = "user_docs",
        .description = "Flag is implemented but missing from user-facing markdown documentation.",
        .severity = ConflictSeverity::ConflictMedium,
      });
    }
    if (flag.defined_in_planning && !flag.defined_in_code) {
      flag.conflicts.push_back(model::FlagConflict{
        .type = ConflictType::PlanningMismatch,
        .source1 = "planning",
        .source2 = "code",
        .description = "Flag mentioned in planning documents but not implemented in code.",
        .severity = ConflictSeverity::ConflictHigh,
      });
    }
  }
}

bool FlagSystem::validate(const engine::AnalysisContext& ctx, engine::Workspace&,
                          std::vector<FlagStatus>& flags, std::string& err) {
  if (!help_) {
    err = "no help text renderer configured";
    return false;
  }
  std::string help_text;
  if (!help_->render(help_text, err)) return false;

  for (auto& flag : flags) {
    if (ctx.cancelled()) {
      err = "cancelled";
      return false;
    }
    if (flag.status == FlagImplStatus::PlannedNotImplemented) continue;
    if (contains(help_text, layout_.flag_marker + flag.long_form)) {
      flag.actual_behavior = kPresentInHelp;
      flag.test_coverage = true;
    } else {
      flag.actual_behavior = kNotFoundInHelp;
      flag.test_coverage = false;
    }
  }
  return true;
}

bool FlagSystem::reconcile(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace& ws,
                           std::vector<FlagStatus>& flags, std::string& err) {
  std::string e;
  if (!catalog(ctx, root, ws, flags, e)) {
    err = "cataloging flags: " + e;
    return false;
  }
  auto warn = [](const char* phase, const std::string& why) {
    std::fprintf(stderr, "selfaudit: FlagSystem: %s: %s\n", phase, util::sanitize_output(why).c_str());
  };
  e.clear();
  if (!classify(ctx, root, ws, flags, e)) warn("classifying flags", e);
  e.clear();
  if (!cross_reference(ctx, root, ws, flags, e)) warn("cross-referencing flags", e);
  detect_conflicts(flags);
  e.clear();
  if (!validate(ctx, ws, flags, e)) warn("validating flags", e);
  return true;
}

static std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::vector<model::Issue> FlagSystem::report_issues(const fs::path& location,
                                                    const std::vector<FlagStatus>& flags) const {
  using namespace model;
  std::vector<Issue> issues;
  const std::string loc = location.string();
  for (const auto& flag : flags) {
    const std::string marked = layout_.flag_marker + flag.long_form;
    if (flag.status == FlagImplStatus::PartiallyImplemented) {
      Issue i{};
      i.id = "FLAG-PARTIAL-IMPLEMENTATION";
      i.category = Category::Usability;
      i.severity = Severity::Medium;
      i.priority = Priority::P2;
      i.effort = Effort::Medium;
      i.title = "Flag '" + marked + "' is partially implemented";
      i.description = "The flag '" + marked + "' is defined but not fully integrated into the configuration system.";
      i.location = loc;
      i.suggestion = "Complete the implementation of '" + marked + "' in the " + layout_.config_package + " package.";
      issues.push_back(std::move(i));
    }
    if (flag.actual_behavior == kNotFoundInHelp) {
      Issue i{};
      i.id = "FLAG-MISSING-FROM-HELP-OUTPUT";
      i.category = Category::Usability;
      i.severity = Severity::High;
      i.priority = Priority::P1;
      i.effort = Effort::Small;
      i.title = "Flag '" + marked + "' missing from CLI help output";
      i.description = "The flag '" + marked + "' is defined in code but does not appear in the rendered help text.";
      i.location = loc;
      i.suggestion = "Ensure the flag is correctly added to the flag set used by the CLI.";
      issues.push_back(std::move(i));
    }
    for (const auto& c : flag.conflicts) {
      Issue i{};
      i.id = "FLAG-CONFLICT-" + upper(to_string(c.type));
      i.category = Category::Usability;
      i.severity = (c.severity == ConflictSeverity::ConflictHigh || c.severity == ConflictSeverity::ConflictCritical)
                       ? Severity::High : Severity::Medium;
      i.priority = Priority::P1;
      i.effort = Effort::Small;
      i.title = "Conflict detected for flag '" + marked + "'";
      i.description = c.description;
      i.location = loc;
      i.suggestion = "Resolve the discrepancy between the flag sources.";
      issues.push_back(std::move(i));
    }
  }
  return issues;
}

bool FlagSystem::analyze(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace& ws,
                         std::vector<model::Issue>& issues, std::string& err) {
  std::vector<FlagStatus> flags;
  if (!reconcile(ctx, root, ws, flags, err)) return false;

  fs::path location;
  std::string lerr;
  if (!locate_config_package(root, location, lerr)) location = root / layout_.package_root;

  std::string catalog_text;
  for (const auto& f : flags) {
    catalog_text += f.long_form + '\t' + f.short_form + '\t' + std::string(to_string(f.status)) + '\n';
  }
  std::string werr;
  if (!ws.write_file("flags/catalog.txt", catalog_text, werr)) {
    std::fprintf(stderr, "selfaudit: FlagSystem: %s\n", util::sanitize_output(werr).c_str());
  }

  auto found = report_issues(location, flags);
  issues.insert(issues.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  last_flags_ = std::move(flags);
  return true;
}

} // namespace selfaudit::flags
