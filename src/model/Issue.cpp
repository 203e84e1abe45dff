#include "model/Issue.hpp"
#include "model/FlagStatus.hpp"

namespace selfaudit::model {

std::string_view to_string(Category c) {
  switch (c) {
    case Category::CodeQuality:   return "code_quality";
    case Category::Documentation: return "documentation";
    case Category::Testing:       return "testing";
    case Category::Security:      return "security";
    case Category::Performance:   return "performance";
    case Category::Usability:     return "usability";
  }
  return "unknown";
}

std::string_view to_string(Severity s) {
  switch (s) {
    case Severity::Critical: return "critical";
    case Severity::High:     return "high";
    case Severity::Medium:   return "medium";
    case Severity::Low:      return "low";
    case Severity::Info:     return "info";
  }
  return "unknown";
}

std::string_view to_string(Priority p) {
  switch (p) {
    case Priority::P0: return "P0";
    case Priority::P1: return "P1";
    case Priority::P2: return "P2";
    case Priority::P3: return "P3";
  }
  return "P?";
}

std::string_view to_string(Effort e) {
  switch (e) {
    case Effort::Small:  return "small";
    case Effort::Medium: return "medium";
    case Effort::Large:  return "large";
  }
  return "unknown";
}

std::string_view to_string(IssueStatus s) {
  switch (s) {
    case IssueStatus::Pending:    return "pending";
    case IssueStatus::InProgress: return "in_progress";
    case IssueStatus::Completed:  return "completed";
    case IssueStatus::Blocked:    return "blocked";
  }
  return "unknown";
}

std::string_view to_string(FlagImplStatus s) {
  switch (s) {
    case FlagImplStatus::FullyImplemented:      return "fully_implemented";
    case FlagImplStatus::PartiallyImplemented:  return "partially_implemented";
    case FlagImplStatus::PlannedNotImplemented: return "planned_not_implemented";
    case FlagImplStatus::NeedsRepair:           return "needs_repair";
  }
  return "unknown";
}

std::string_view to_string(ConflictType t) {
  switch (t) {
    case ConflictType::OrphanedFlag:        return "orphaned_flag";
    case ConflictType::DescriptionConflict: return "description_conflict";
    case ConflictType::PlanningMismatch:    return "planning_mismatch";
  }
  return "unknown";
}

std::string_view to_string(ConflictSeverity s) {
  switch (s) {
    case ConflictSeverity::ConflictMedium:   return "medium";
    case ConflictSeverity::ConflictHigh:     return "high";
    case ConflictSeverity::ConflictCritical: return "critical";
  }
  return "unknown";
}

} // namespace selfaudit::model
