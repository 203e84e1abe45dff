#pragma once
#include <string>
#include <vector>

#include "util/TomlReader.hpp"

namespace selfaudit::flags {

// Where the audited project keeps its flag registrations, its entry point and
// its documentation. Defaults describe a Go project laid out as
// internal/config + cmd/<prog>/main.go.
struct FlagLayout {
  std::string config_package{"config"};
  std::string package_root{"internal"};
  std::string main_source{"cmd/main/main.go"};
  std::vector<std::string> source_extensions{".go"};
  std::vector<std::string> test_suffixes{"_test.go"};
  std::vector<std::string> registration_suffixes{"Var", "VarP"};
  std::string short_suffix{"P"};
  std::vector<std::string> config_receivers{"cfg", "c"};
  std::string changed_call{"flagSet.Changed(\""};
  std::string flag_marker{"--"};
  std::vector<std::string> user_docs{
    "README.md",
    "docs/user/dry-run.md",
    "docs/user/examples.md",
    "docs/user/filtering.md",
    "docs/user/incremental.md",
    "docs/user/command-reference.md",
  };
  std::vector<std::string> planning_docs{
    "docs/checkpoint/checkpoint_design.md",
    "docs/checkpoint/chekpoint_requirements.md",
    "docs/remediation/audit_remediation_plan.md",
    "docs/remediation/remediation_tasks.md",
    "docs/dev/flag_conflicts.md",
    "docs/design/new_conflict_resolution.md",
  };
  // Command whose stdout is the audited program's help text; empty means
  // the help text is taken from the configuration sources alone.
  std::string help_command;

  [[nodiscard]] bool is_source_file(const std::string& filename) const;
};

// Overlays keys present in the [flags] section onto layout.
void apply_flag_layout(const util::TomlReader& tr, FlagLayout& layout);

} // namespace selfaudit::flags
