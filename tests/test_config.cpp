#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace selfaudit;

static const char* kEnv[] = {
  "SELFAUDIT_CONFIG", "SELFAUDIT_VERBOSE", "SELFAUDIT_STORAGE_THRESHOLD", "selfaudit_STORAGE_THRESHOLD",
  "SELFAUDIT_SKIP_CLEANUP", "SELFAUDIT_ARCHIVE_ROOT", "SELFAUDIT_MAX_ACTIVE", "SELFAUDIT_RETENTION_MONTHS",
};

static fs::path fresh_env(const char* tag) {
  for (const char* n : kEnv) ::unsetenv(n);
  auto dir = fs::temp_directory_path() / ("selfaudit_test_config_" + std::string(tag) + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  return dir;
}

TEST(defaults_without_file) {
  auto dir = fresh_env("defaults");
  app::Config c;
  std::string err;
  ASSERT_TRUE(app::load_config("", c, err));
  ASSERT_FALSE(c.from_file);
  ASSERT_EQ(c.path, "");
  ASSERT_EQ(c.archive.root, "major_checkpoint");
  ASSERT_EQ(c.archive.max_active, 5);
  ASSERT_EQ(c.archive.retention_months, 6);
  ASSERT_TRUE(c.cleanup.storage_threshold == 75.0);
  ASSERT_FALSE(c.cleanup.skip);
  ASSERT_EQ(c.run.root, ".");
  ASSERT_EQ(app::config_file_path(), (dir / "selfaudit/config.toml").string());
  fs::remove_all(dir);
}

TEST(explicit_missing_file_is_error) {
  auto dir = fresh_env("missing");
  app::Config c;
  std::string err;
  ASSERT_FALSE(app::load_config((dir / "nope.toml").string(), c, err));
  ASSERT_EQ(err, "config file not found: " + (dir / "nope.toml").string());
  ::setenv("SELFAUDIT_CONFIG", (dir / "also-nope.toml").c_str(), 1);
  ASSERT_FALSE(app::load_config("", c, err));
  ::unsetenv("SELFAUDIT_CONFIG");
  fs::remove_all(dir);
}

TEST(file_wins_over_environment) {
  auto dir = fresh_env("layers");
  auto file = dir / "selfaudit/config.toml";
  fs::create_directories(file.parent_path());
  std::ofstream(file) <<
      "[archive]\n"
      "max_active = 3\n"
      "root = \"audits\"\n"
      "[cleanup]\n"
      "skip = true\n"
      "[flags]\n"
      "config_package = \"options\"\n";
  ::setenv("SELFAUDIT_MAX_ACTIVE", "9", 1);
  ::setenv("SELFAUDIT_RETENTION_MONTHS", "2", 1);
  ::setenv("selfaudit_STORAGE_THRESHOLD", "80.5", 1);
  app::Config c;
  std::string err;
  ASSERT_TRUE(app::load_config("", c, err));
  ASSERT_TRUE(c.from_file);
  ASSERT_EQ(c.path, file.string());
  ASSERT_EQ(c.archive.max_active, 3);
  ASSERT_EQ(c.archive.root, "audits");
  ASSERT_EQ(c.archive.retention_months, 2);
  ASSERT_TRUE(c.cleanup.storage_threshold == 80.5);
  ASSERT_TRUE(c.cleanup.skip);
  ASSERT_EQ(c.flags.config_package, "options");
  ASSERT_EQ(c.flags.package_root, "internal");
  for (const char* n : kEnv) ::unsetenv(n);
  fs::remove_all(dir);
}

TEST(config_env_names_file) {
  auto dir = fresh_env("envfile");
  auto file = dir / "custom.toml";
  std::ofstream(file) << "[run]\nroot = \"src\"\nverbose = true\n";
  ::setenv("SELFAUDIT_CONFIG", file.c_str(), 1);
  app::Config c;
  std::string err;
  ASSERT_TRUE(app::load_config("", c, err));
  ASSERT_EQ(c.run.root, "src");
  ASSERT_TRUE(c.run.verbose);
  ::unsetenv("SELFAUDIT_CONFIG");
  fs::remove_all(dir);
}

TEST(env_parsing_falls_back_on_garbage) {
  fresh_env("garbage");
  ::setenv("SELFAUDIT_MAX_ACTIVE", "7x", 1);
  ASSERT_EQ(app::getenv_int("SELFAUDIT_MAX_ACTIVE", 5), 5);
  ::setenv("SELFAUDIT_MAX_ACTIVE", "7", 1);
  ASSERT_EQ(app::getenv_int("SELFAUDIT_MAX_ACTIVE", 5), 7);
  ::setenv("SELFAUDIT_STORAGE_THRESHOLD", "high", 1);
  ASSERT_TRUE(app::getenv_double("SELFAUDIT_STORAGE_THRESHOLD", 75.0) == 75.0);
  ASSERT_TRUE(app::getenv_compat("SELFAUDIT_UNSET_FOR_TEST") == nullptr);
  for (const char* n : kEnv) ::unsetenv(n);
}
