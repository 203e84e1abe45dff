#pragma once
#include <string>
#include <unordered_map>

namespace selfaudit::flags {

// "dry-run" -> "DryRun". Pure; words split on '-', '_' and ' '.
[[nodiscard]] std::string title_case_field(const std::string& long_form);

// Maps a flag's long form to the configuration field that stores it. Exact
// overrides win over the title-case transform.
class FieldNameMapper {
public:
  FieldNameMapper();

  void add_override(const std::string& long_form, const std::string& field);
  [[nodiscard]] std::string map(const std::string& long_form) const;

private:
  std::unordered_map<std::string, std::string> overrides_;
};

} // namespace selfaudit::flags
