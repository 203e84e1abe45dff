#include "report/Report.hpp"

#include <algorithm>
#include <array>
#include <cstdio>

#include "util/FileIO.hpp"

namespace selfaudit::report {

namespace fs = std::filesystem;
using namespace selfaudit::model;

void sort_issues(std::vector<Issue>& issues) {
  std::stable_sort(issues.begin(), issues.end(), [](const Issue& a, const Issue& b) {
    if (rank(a.priority) != rank(b.priority)) return rank(a.priority) < rank(b.priority);
    return rank(a.severity) < rank(b.severity);
  });
}

std::string render_flag_report(const std::vector<FlagStatus>& flags) {
  auto mark = [](bool b) { return b ? "yes" : "no"; };
  std::string out = "# CLI Flag Status and Conflict Report\n\n";
  out += "| Flag | Status | Help | Docs | Plan | Conflicts |\n";
  out += "|------|--------|------|------|------|-----------|\n";
  for (const auto& f : flags) {
    std::string conflicts;
    for (const auto& c : f.conflicts) {
      if (!conflicts.empty()) conflicts += ", ";
      conflicts += to_string(c.type);
    }
    if (conflicts.empty()) conflicts = "None";
    out += "| --" + f.long_form + " | " + std::string(to_string(f.status)) + " | " + mark(f.defined_in_help) +
           " | " + mark(f.defined_in_docs) + " | " + mark(f.defined_in_planning) + " | " + conflicts + " |\n";
  }
  return out;
}

std::string csv_field(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
  std::string out = "\"";
  for (char c : value) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += '"';
  return out;
}

std::string render_issues_csv(const std::vector<Issue>& issues) {
  std::string out = "Status,ID,Category,Severity,Priority,Title,Location,Effort,Description,Suggestion\r\n";
  for (const auto& i : issues) {
    const std::array<std::string, 10> row{
      std::string(to_string(i.status)), i.id, std::string(to_string(i.category)),
      std::string(to_string(i.severity)), std::string(to_string(i.priority)), i.title, i.location,
      std::string(to_string(i.effort)), i.description, i.suggestion,
    };
    for (size_t k = 0; k < row.size(); ++k) {
      if (k) out += ',';
      out += csv_field(row[k]);
    }
    out += "\r\n";
  }
  return out;
}

std::string render_summary(const std::vector<Issue>& issues) {
  static constexpr std::array severities{Severity::Critical, Severity::High, Severity::Medium, Severity::Low,
                                         Severity::Info};
  static constexpr std::array categories{Category::CodeQuality, Category::Documentation, Category::Testing,
                                         Category::Security, Category::Performance, Category::Usability};
  std::string out = "# Audit Summary\n\nTotal issues: " + std::to_string(issues.size()) + "\n\n";
  out += "## By severity\n\n| Severity | Count |\n|----------|-------|\n";
  for (auto s : severities) {
    auto n = std::count_if(issues.begin(), issues.end(), [&](const Issue& i) { return i.severity == s; });
    out += "| " + std::string(to_string(s)) + " | " + std::to_string(n) + " |\n";
  }
  out += "\n## By category\n\n| Category | Count |\n|----------|-------|\n";
  for (auto c : categories) {
    auto n = std::count_if(issues.begin(), issues.end(), [&](const Issue& i) { return i.category == c; });
    if (n == 0) continue;
    out += "| " + std::string(to_string(c)) + " | " + std::to_string(n) + " |\n";
  }
  return out;
}

bool write_latest(const fs::path& latest_dir, const std::vector<std::pair<std::string, std::string>>& files,
                  std::string& err) {
  std::error_code ec;
  fs::create_directories(latest_dir, ec);
  if (ec) {
    err = "failed to create " + latest_dir.string() + ": " + ec.message();
    return false;
  }
  for (const auto& [name, content] : files) {
    auto clean = fs::path(name).filename();
    if (clean.empty() || clean == "." || clean == "..") {
      err = "invalid artifact name: " + name;
      return false;
    }
    if (!util::write_file_string(latest_dir / clean, content, err)) return false;
  }
  return true;
}

} // namespace selfaudit::report
