#include "flags/FlagLayout.hpp"

namespace selfaudit::flags {

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool FlagLayout::is_source_file(const std::string& filename) const {
  for (const auto& t : test_suffixes)
    if (ends_with(filename, t)) return false;
  for (const auto& ext : source_extensions)
    if (ends_with(filename, ext)) return true;
  return false;
}

void apply_flag_layout(const util::TomlReader& tr, FlagLayout& layout) {
  const auto* sec = tr.section("flags");
  if (!sec) return;
  auto str = [&](const char* key, std::string& dst) {
    if (sec->has(key)) dst = sec->get_string(key);
  };
  auto arr = [&](const char* key, std::vector<std::string>& dst) {
    if (sec->has(key)) dst = sec->get_array(key);
  };
  str("config_package", layout.config_package);
  str("package_root", layout.package_root);
  str("main_source", layout.main_source);
  str("short_suffix", layout.short_suffix);
  str("changed_call", layout.changed_call);
  str("flag_marker", layout.flag_marker);
  str("help_command", layout.help_command);
  arr("source_extensions", layout.source_extensions);
  arr("test_suffixes", layout.test_suffixes);
  arr("registration_suffixes", layout.registration_suffixes);
  arr("config_receivers", layout.config_receivers);
  arr("user_docs", layout.user_docs);
  arr("planning_docs", layout.planning_docs);
}

} // namespace selfaudit::flags
