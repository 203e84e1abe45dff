#include "engines/MarkerScanner.hpp"

#include <algorithm>
#include <cctype>

#include "util/FileIO.hpp"

namespace selfaudit::engines {

namespace fs = std::filesystem;

static bool skipped_dir(const std::string& name) {
  if (!name.empty() && name[0] == '.') return true;
  static const char* skip[] = {"build", "vendor", "node_modules", "third_party", "testdata"};
  for (const char* s : skip) if (name == s) return true;
  return false;
}

bool collect_source_files(const fs::path& root, const std::vector<std::string>& extensions,
                          std::vector<fs::path>& out, std::string& err) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    err = "cannot read root path " + root.string() + ": not a directory";
    return false;
  }
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    err = "cannot read root path " + root.string() + ": " + ec.message();
    return false;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      err = "walking " + root.string() + ": " + ec.message();
      return false;
    }
    std::error_code dec;
    auto name = it->path().filename().string();
    if (it->is_directory(dec)) {
      if (skipped_dir(name)) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(dec)) continue;
    auto ext = it->path().extension().string();
    if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return true;
}

MarkerScanner::MarkerScanner(std::vector<std::string> extensions)
    : BaseEngine("TechDebt"), extensions_(std::move(extensions)) {
  register_task([this](const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace& ws,
                       std::vector<model::Issue>& issues, std::string& err) {
    return scan(ctx, root, ws, issues, err);
  });
}

bool MarkerScanner::analyze(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace& ws,
                            std::vector<model::Issue>& issues, std::string& err) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    err = "cannot read root path " + root.string() + ": not a directory";
    return false;
  }
  return BaseEngine::analyze(ctx, root, ws, issues, err);
}

// Marker word inside the comment part of a line, or empty
static std::string find_marker(const std::string& line) {
  auto pos = line.find("//");
  if (pos == std::string::npos) pos = line.find("/*");
  if (pos == std::string::npos) {
    // continuation line of a block comment
    auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos || line[first] != '*') return {};
    pos = first;
  }
  static const char* markers[] = {"TODO", "FIXME", "HACK", "XXX"};
  for (const char* m : markers) {
    auto at = line.find(m, pos);
    if (at == std::string::npos) continue;
    size_t end = at + std::char_traits<char>::length(m);
    bool word = (at == 0 || !std::isalnum(static_cast<unsigned char>(line[at - 1]))) &&
                (end >= line.size() || !std::isalnum(static_cast<unsigned char>(line[end])));
    if (word) return m;
  }
  return {};
}

bool MarkerScanner::scan(const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace&,
                         std::vector<model::Issue>& issues, std::string& err) const {
  std::vector<fs::path> files;
  if (!collect_source_files(root, extensions_, files, err)) return false;
  for (const auto& file : files) {
    if (ctx.cancelled()) break;
    auto text = util::read_file_string(file);
    if (!text) continue;
    size_t pos = 0;
    int line_no = 0;
    while (pos < text->size()) {
      size_t nl = text->find('\n', pos);
      if (nl == std::string::npos) nl = text->size();
      std::string line = text->substr(pos, nl - pos);
      pos = nl + 1;
      ++line_no;
      auto marker = find_marker(line);
      if (marker.empty()) continue;
      model::Issue i{};
      i.id = "DEBT-MARKER";
      i.category = model::Category::CodeQuality;
      i.severity = (marker == "FIXME" || marker == "HACK") ? model::Severity::Low : model::Severity::Info;
      i.priority = model::Priority::P3;
      i.effort = model::Effort::Small;
      i.title = marker + " marker in " + file.filename().string();
      i.description = line;
      i.location = file.string() + ":" + std::to_string(line_no);
      i.suggestion = "Resolve the marked work or track it in the issue tracker.";
      issues.push_back(std::move(i));
    }
  }
  return true;
}

} // namespace selfaudit::engines
