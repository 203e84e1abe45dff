#pragma once
#include <string>
#include <string_view>

namespace selfaudit::model {

enum class Category { CodeQuality, Documentation, Testing, Security, Performance, Usability };

// Ordered most to least severe
enum class Severity { Critical, High, Medium, Low, Info };

enum class Priority { P0, P1, P2, P3 };

enum class Effort { Small, Medium, Large };

enum class IssueStatus { Pending, InProgress, Completed, Blocked };

struct Issue {
  std::string id;          // stable category code, e.g. FLAG-CONFLICT-ORPHANED_FLAG
  Category    category{Category::CodeQuality};
  Severity    severity{Severity::Medium};
  Priority    priority{Priority::P2};
  std::string title;
  std::string description;
  std::string location;    // file:line or path
  std::string suggestion;
  Effort      effort{Effort::Small};
  IssueStatus status{IssueStatus::Pending};
};

[[nodiscard]] auto to_string(Category c) -> std::string_view;
[[nodiscard]] auto to_string(Severity s) -> std::string_view;
[[nodiscard]] auto to_string(Priority p) -> std::string_view;
[[nodiscard]] auto to_string(Effort e) -> std::string_view;
[[nodiscard]] auto to_string(IssueStatus s) -> std::string_view;

// Lower rank sorts first
[[nodiscard]] inline int rank(Severity s) { return static_cast<int>(s); }
[[nodiscard]] inline int rank(Priority p) { return static_cast<int>(p); }

} // namespace selfaudit::model
