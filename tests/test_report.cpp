#include "minitest.hpp"
#include "report/Report.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace selfaudit;
using model::Issue;

static Issue issue(const char* id, model::Priority p, model::Severity s,
                   model::Category c = model::Category::CodeQuality) {
  Issue i{};
  i.id = id;
  i.priority = p;
  i.severity = s;
  i.category = c;
  return i;
}

TEST(sort_by_priority_then_severity_stable) {
  using model::Priority;
  using model::Severity;
  std::vector<Issue> v{
    issue("a", Priority::P3, Severity::Info),
    issue("b", Priority::P1, Severity::Medium),
    issue("c", Priority::P1, Severity::High),
    issue("d", Priority::P0, Severity::Low),
    issue("e", Priority::P1, Severity::Medium),
  };
  report::sort_issues(v);
  std::vector<std::string> ids;
  for (const auto& i : v) ids.push_back(i.id);
  ASSERT_EQ(ids, (std::vector<std::string>{"d", "c", "b", "e", "a"}));
}

TEST(csv_quotes_when_needed) {
  ASSERT_EQ(report::csv_field("plain"), "plain");
  ASSERT_EQ(report::csv_field("a,b"), "\"a,b\"");
  ASSERT_EQ(report::csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
  ASSERT_EQ(report::csv_field("two\nlines"), "\"two\nlines\"");

  Issue i = issue("FLAG-X", model::Priority::P1, model::Severity::High, model::Category::Usability);
  i.title = "Flag '--a' missing, really";
  i.location = "internal/config";
  auto csv = report::render_issues_csv({i});
  ASSERT_EQ(csv,
            "Status,ID,Category,Severity,Priority,Title,Location,Effort,Description,Suggestion\r\n"
            "pending,FLAG-X,usability,high,P1,\"Flag '--a' missing, really\",internal/config,small,,\r\n");
}

TEST(flag_table_rows) {
  model::FlagStatus a{};
  a.long_form = "dry-run";
  a.status = model::FlagImplStatus::FullyImplemented;
  a.defined_in_help = true;
  a.defined_in_docs = true;
  model::FlagStatus b{};
  b.long_form = "since";
  b.defined_in_planning = true;
  b.conflicts.push_back(model::FlagConflict{.type = model::ConflictType::PlanningMismatch});
  b.conflicts.push_back(model::FlagConflict{.type = model::ConflictType::OrphanedFlag});
  auto md = report::render_flag_report({a, b});
  ASSERT_TRUE(md.rfind("# CLI Flag Status and Conflict Report\n", 0) == 0);
  ASSERT_TRUE(md.find("| --dry-run | fully_implemented | yes | yes | no | None |\n") != std::string::npos);
  ASSERT_TRUE(md.find("| --since | planned_not_implemented | no | no | yes | planning_mismatch, orphaned_flag |\n") !=
              std::string::npos);
}

TEST(summary_counts) {
  std::vector<Issue> v{
    issue("a", model::Priority::P1, model::Severity::High, model::Category::Usability),
    issue("b", model::Priority::P1, model::Severity::High, model::Category::Usability),
    issue("c", model::Priority::P3, model::Severity::Info),
  };
  auto md = report::render_summary(v);
  ASSERT_TRUE(md.find("Total issues: 3\n") != std::string::npos);
  ASSERT_TRUE(md.find("| high | 2 |\n") != std::string::npos);
  ASSERT_TRUE(md.find("| critical | 0 |\n") != std::string::npos);
  ASSERT_TRUE(md.find("| usability | 2 |\n") != std::string::npos);
  ASSERT_TRUE(md.find("| code_quality | 1 |\n") != std::string::npos);
  ASSERT_TRUE(md.find("| security |") == std::string::npos);
}

TEST(write_latest_files) {
  auto dir = fs::temp_directory_path() / ("selfaudit_test_report_" + std::to_string(::getpid())) / "active/latest";
  fs::remove_all(dir.parent_path().parent_path());
  std::string err;
  ASSERT_TRUE(report::write_latest(dir, {{"summary.md", "# s\n"}, {"../escape.csv", "x"}}, err));
  ASSERT_TRUE(fs::exists(dir / "summary.md"));
  ASSERT_TRUE(fs::exists(dir / "escape.csv"));
  ASSERT_FALSE(fs::exists(dir.parent_path() / "escape.csv"));
  ASSERT_FALSE(report::write_latest(dir, {{"..", "x"}}, err));
  fs::remove_all(dir.parent_path().parent_path());
}
