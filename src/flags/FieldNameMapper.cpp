#include "flags/FieldNameMapper.hpp"

#include <cctype>

namespace selfaudit::flags {

std::string title_case_field(const std::string& long_form) {
  std::string out;
  out.reserve(long_form.size());
  bool word_start = true;
  for (char c : long_form) {
    if (c == '-' || c == '_' || c == ' ') { word_start = true; continue; }
    if (word_start) {
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      word_start = false;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

FieldNameMapper::FieldNameMapper()
    : overrides_{
        {"json", "JSON"},
        {"jsonl", "JSONL"},
        {"help", "ShowHelp"},
        {"version", "ShowVersion"},
        {"config", "ConfigFile"},
        {"log-json", "LogJSON"},
        {"format", "OutputFormat"},
        {"csv", "CSV"},
      } {}

void FieldNameMapper::add_override(const std::string& long_form, const std::string& field) {
  overrides_[long_form] = field;
}

std::string FieldNameMapper::map(const std::string& long_form) const {
  if (auto it = overrides_.find(long_form); it != overrides_.end()) return it->second;
  return title_case_field(long_form);
}

} // namespace selfaudit::flags
