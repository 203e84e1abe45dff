#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace selfaudit::model {

enum class FlagImplStatus { FullyImplemented, PartiallyImplemented, PlannedNotImplemented, NeedsRepair };

enum class ConflictType { OrphanedFlag, DescriptionConflict, PlanningMismatch };

enum class ConflictSeverity { ConflictMedium, ConflictHigh, ConflictCritical };

struct FlagConflict {
  ConflictType     type{ConflictType::OrphanedFlag};
  std::string      source1;   // provenance, e.g. "code"
  std::string      source2;   // e.g. "documentation"
  std::string      description;
  ConflictSeverity severity{ConflictSeverity::ConflictMedium};
};

struct FlagStatus {
  std::string    name;
  std::string    long_form;
  std::string    short_form;
  std::string    description;
  FlagImplStatus status{FlagImplStatus::PlannedNotImplemented};
  bool defined_in_code{false};
  bool defined_in_help{false};
  bool defined_in_docs{false};
  bool defined_in_planning{false};
  bool test_coverage{false};
  std::string actual_behavior;
  std::vector<FlagConflict> conflicts;  // append-only within a run

  [[nodiscard]] bool has_conflict(ConflictType t) const {
    for (const auto& c : conflicts)
      if (c.type == t) return true;
    return false;
  }
};

[[nodiscard]] auto to_string(FlagImplStatus s) -> std::string_view;
[[nodiscard]] auto to_string(ConflictType t) -> std::string_view;
[[nodiscard]] auto to_string(ConflictSeverity s) -> std::string_view;

} // namespace selfaudit::model
