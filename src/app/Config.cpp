#include "app/Config.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>

#include "util/TomlReader.hpp"

namespace selfaudit::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  std::string alt;
  if (n.rfind("SELFAUDIT_", 0) == 0) {
    alt = "selfaudit_" + n.substr(10);
  } else if (n.rfind("selfaudit_", 0) == 0) {
    alt = "SELFAUDIT_" + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  std::string_view s(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return defv;
  return out;
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  char* end = nullptr;
  double out = std::strtod(v, &end);
  if (end == v || *end != '\0') return defv;
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/selfaudit/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/selfaudit/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

bool load_config(const std::string& path_override, Config& out, std::string& err) {
  Config c{};
  bool explicit_path = true;
  std::string path = path_override;
  if (path.empty()) {
    if (const char* v = getenv_compat("SELFAUDIT_CONFIG")) path = v;
  }
  if (path.empty()) {
    path = config_file_path();
    explicit_path = false;
  }

  util::TomlReader toml;
  bool have_toml = false;
  if (!path.empty()) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (!exists && explicit_path) {
      err = "config file not found: " + path;
      return false;
    }
    if (exists) {
      if (!toml.load(path)) {
        err = "failed to read config file: " + path;
        return false;
      }
      have_toml = true;
      c.path = path;
      c.from_file = true;
    }
  }

  // --- [run] ---
  c.run.root    = resolve_string(toml, have_toml, "run", "root", nullptr, c.run.root);
  c.run.verbose = resolve_bool(toml, have_toml, "run", "verbose", "SELFAUDIT_VERBOSE", false);

  // --- [cleanup] ---
  c.cleanup.storage_threshold = resolve_double(toml, have_toml, "cleanup", "storage_threshold",
                                               "SELFAUDIT_STORAGE_THRESHOLD", 75.0);
  c.cleanup.skip = resolve_bool(toml, have_toml, "cleanup", "skip", "SELFAUDIT_SKIP_CLEANUP", false);

  // --- [archive] ---
  c.archive.root             = resolve_string(toml, have_toml, "archive", "root", "SELFAUDIT_ARCHIVE_ROOT", c.archive.root);
  c.archive.max_active       = resolve_int(toml, have_toml, "archive", "max_active", "SELFAUDIT_MAX_ACTIVE", 5);
  c.archive.retention_months = resolve_int(toml, have_toml, "archive", "retention_months", "SELFAUDIT_RETENTION_MONTHS", 6);

  // --- [flags] ---
  if (have_toml) flags::apply_flag_layout(toml, c.flags);

  out = std::move(c);
  return true;
}

} // namespace selfaudit::app
