#include "minitest.hpp"
#include "engine/Workspace.hpp"
#include "engines/DocGapScanner.hpp"
#include "engines/MarkerScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace selfaudit;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / ("selfaudit_test_engines_" + std::string(tag) + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

static void write(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

TEST(collect_skips_hidden_and_vendor) {
  auto root = make_root("collect");
  write(root / "b.go", "");
  write(root / "a/x.go", "");
  write(root / "a/x.txt", "");
  write(root / ".git/hooks/y.go", "");
  write(root / "vendor/lib/z.go", "");
  write(root / "build/gen.go", "");
  std::vector<fs::path> files;
  std::string err;
  ASSERT_TRUE(engines::collect_source_files(root, {".go"}, files, err));
  ASSERT_EQ(files, (std::vector<fs::path>{root / "a/x.go", root / "b.go"}));
  ASSERT_FALSE(engines::collect_source_files(root / "missing", {".go"}, files, err));
  fs::remove_all(root);
}

TEST(markers_in_comments_only) {
  auto root = make_root("markers");
  write(root / "main.go",
        "package main\n"
        "// TODO: split this up\n"
        "var todoList = \"TODO in a string\"\n"
        "func f() { g() } // FIXME leaks\n"
        "/*\n"
        " * HACK around the parser\n"
        " */\n"
        "// TODOS is not a marker, nor is XXXL\n");
  write(root / "notes.txt", "// TODO ignored extension\n");
  engines::MarkerScanner scanner;
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_TRUE(scanner.analyze({}, root, ws, issues, err));
  ASSERT_EQ(issues.size(), 3u);
  ASSERT_EQ(issues[0].location, (root / "main.go").string() + ":2");
  ASSERT_EQ(issues[0].title, "TODO marker in main.go");
  ASSERT_TRUE(issues[0].severity == model::Severity::Info);
  ASSERT_EQ(issues[1].location, (root / "main.go").string() + ":4");
  ASSERT_TRUE(issues[1].severity == model::Severity::Low);
  ASSERT_EQ(issues[2].location, (root / "main.go").string() + ":6");
  ASSERT_EQ(issues[2].id, "DEBT-MARKER");
  fs::remove_all(root);
}

TEST(marker_scanner_missing_root_fails) {
  engines::MarkerScanner scanner;
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_FALSE(scanner.analyze({}, "/nonexistent/selfaudit/root", ws, issues, err));
  ASSERT_TRUE(err.find("not a directory") != std::string::npos);
  ASSERT_TRUE(issues.empty());
}

TEST(doc_gaps_for_exported_symbols) {
  auto root = make_root("docs");
  write(root / "pkg/api.go",
        "package pkg\n"
        "\n"
        "// Client talks to the server.\n"
        "type Client struct{}\n"
        "\n"
        "func NewClient() *Client { return &Client{} }\n"
        "\n"
        "func internalHelper() {}\n");
  write(root / "pkg/api_test.go", "package pkg\nfunc TestClient(t *testing.T) {}\n");
  write(root / "pkg/bad.go", "var s = \"unterminated\n");
  engines::DocGapScanner scanner;
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_TRUE(scanner.analyze({}, root, ws, issues, err));
  ASSERT_EQ(issues.size(), 1u);
  ASSERT_EQ(issues[0].id, "DOC-MISSING-COMMENT");
  ASSERT_EQ(issues[0].location, (root / "pkg/api.go").string() + ":6");
  ASSERT_TRUE(issues[0].category == model::Category::Documentation);
  fs::remove_all(root);
}

TEST(doc_gap_missing_root_becomes_task_issue) {
  engines::DocGapScanner scanner;
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_TRUE(scanner.analyze({}, "/nonexistent/selfaudit/root", ws, issues, err));
  ASSERT_EQ(issues.size(), 1u);
  ASSERT_EQ(issues[0].id, "ENGINE-TASK-FAILURE");
  ASSERT_EQ(issues[0].title, "Task failed in Documentation");
}
