#pragma once
#include <string>

#include "flags/FlagLayout.hpp"

namespace selfaudit::app {

struct ArchiveSettings {
  std::string root{"major_checkpoint"};
  int max_active{5};
  int retention_months{6};
};

struct CleanupSettings {
  double storage_threshold{75.0};
  bool skip{false};
};

struct RunSettings {
  std::string root{"."};
  bool verbose{false};
};

struct Config {
  std::string path;       // file the settings came from; empty if none was read
  bool from_file{false};
  RunSettings run;
  CleanupSettings cleanup;
  ArchiveSettings archive;
  flags::FlagLayout flags;
};

// $XDG_CONFIG_HOME/selfaudit/config.toml, else ~/.config/selfaudit/config.toml.
[[nodiscard]] std::string config_file_path();

// Resolves every setting TOML -> environment -> compiled default. The file is
// path_override if non-empty, else SELFAUDIT_CONFIG, else config_file_path().
// A missing default file is fine; a missing explicitly named file is an error.
[[nodiscard]] bool load_config(const std::string& path_override, Config& out, std::string& err);

// Environment helpers; SELFAUDIT_X falls back to selfaudit_x.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);

} // namespace selfaudit::app
