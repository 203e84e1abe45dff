#include "minitest.hpp"
#include "util/FileIO.hpp"
#include "util/Format.hpp"
#include "util/Glob.hpp"
#include "util/Storage.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace selfaudit::util;

TEST(glob_matches_single_component) {
  ASSERT_TRUE(glob_match("selfaudit-*", "selfaudit-workspace-abc"));
  ASSERT_TRUE(glob_match("*.tmp", "report.tmp"));
  ASSERT_FALSE(glob_match("*.tmp", "report.tmp.bak"));
  ASSERT_TRUE(glob_match("test-?", "test-1"));
  ASSERT_FALSE(glob_match("test-?", "test-12"));
  ASSERT_TRUE(glob_match("[ab]x", "bx"));
  ASSERT_FALSE(glob_match("[!ab]x", "ax"));
  ASSERT_FALSE(glob_match("*", "a/b"));
  ASSERT_TRUE(glob_match("lit\\*", "lit*"));
  ASSERT_FALSE(glob_match("lit\\*", "litx"));
}

TEST(glob_validation) {
  std::string err;
  ASSERT_TRUE(glob_valid("checkpoint-*", err));
  ASSERT_TRUE(glob_valid("[]x]", err));
  ASSERT_TRUE(glob_valid("a\\[b", err));
  ASSERT_FALSE(glob_valid("bad[", err));
  ASSERT_EQ(err, "unterminated character class in pattern");
  ASSERT_FALSE(glob_valid("[!", err));
  ASSERT_FALSE(glob_valid("trailing\\", err));
  ASSERT_EQ(err, "trailing escape in pattern");
}

TEST(format_helpers) {
  ASSERT_EQ(format_bytes(0), "0 B");
  ASSERT_EQ(format_bytes(1023), "1023 B");
  ASSERT_EQ(format_bytes(1536), "1.5 KB");
  ASSERT_EQ(format_bytes(5ull * 1024 * 1024), "5.0 MB");
  ASSERT_EQ(format_duration(std::chrono::milliseconds(850)), "850ms");
  ASSERT_EQ(format_duration(std::chrono::milliseconds(2400)), "2.4s");
  ASSERT_EQ(sanitize_output("ok\x1b[31m\nend"), "ok?[31m?end");
}

TEST(local_time_formatting) {
  std::tm t{};
  t.tm_year = 2024 - 1900; t.tm_mon = 1; t.tm_mday = 29;
  t.tm_hour = 23; t.tm_min = 5; t.tm_sec = 1;
  t.tm_isdst = -1;
  auto tp = std::chrono::system_clock::from_time_t(std::mktime(&t));
  ASSERT_EQ(format_local_time(tp, "%Y-%m-%d_%H-%M-%S"), "2024-02-29_23-05-01");
  ASSERT_EQ(format_local_time(tp, "%Y-%m"), "2024-02");
  ASSERT_EQ(local_tm(tp).tm_mday, 29);
}

TEST(file_io_and_sizes) {
  auto root = fs::temp_directory_path() / ("selfaudit_test_util_io_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sub");
  std::string err;
  ASSERT_TRUE(write_file_string(root / "a.txt", "hello", err));
  ASSERT_TRUE(write_file_string(root / "sub/b.txt", "123", err));
  ASSERT_EQ(*read_file_string(root / "a.txt"), "hello");
  ASSERT_FALSE(read_file_string(root / "missing.txt").has_value());
  ASSERT_FALSE(write_file_string(root / "nodir/c.txt", "x", err));

  uint64_t bytes = 0;
  ASSERT_TRUE(dir_size(root, bytes, err));
  ASSERT_EQ(bytes, 8u);
  ASSERT_TRUE(dir_size(root / "a.txt", bytes, err));
  ASSERT_EQ(bytes, 5u);
  ASSERT_FALSE(dir_size(root / "missing", bytes, err));

  auto pct = storage_used_pct(root);
  ASSERT_TRUE(pct.has_value());
  ASSERT_TRUE(*pct >= 0.0 && *pct <= 100.0);
  ASSERT_FALSE(storage_used_pct(root / "missing").has_value());
  fs::remove_all(root);
}
