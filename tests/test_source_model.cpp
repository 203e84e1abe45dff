#include "minitest.hpp"
#include "source/SourceModel.hpp"
#include <string>

using namespace selfaudit::source;

static SourceModel parse_ok(const std::string& text) {
  TokenSourceModelProvider p;
  SourceModel m;
  std::string err;
  bool ok = p.parse_text(text, m, err);
  if (!ok) throw std::runtime_error("parse failed: " + err);
  return m;
}

TEST(registration_call_arguments) {
  auto m = parse_ok(
      "func register(fs *pflag.FlagSet, cfg *Config) {\n"
      "\tfs.BoolVarP(&cfg.DryRun, \"dry-run\", \"n\", false, \"Preview \\\"changes\\\"\")\n"
      "}\n");
  const Call* reg = nullptr;
  for (const auto& c : m.calls)
    if (c.member == "BoolVarP") reg = &c;
  ASSERT_TRUE(reg != nullptr);
  ASSERT_EQ(reg->receiver, "fs");
  ASSERT_EQ(reg->line, 2);
  ASSERT_EQ(reg->args.size(), 5u);
  ASSERT_FALSE(reg->args[0].is_string_literal);
  ASSERT_EQ(reg->args[0].text, "&cfg.DryRun");
  ASSERT_TRUE(reg->args[1].is_string_literal);
  ASSERT_EQ(reg->args[1].text, "dry-run");
  ASSERT_EQ(reg->args[2].text, "n");
  ASSERT_EQ(reg->args[3].text, "false");
  ASSERT_EQ(reg->args[4].text, "Preview \"changes\"");
}

TEST(nested_arguments_stay_whole) {
  auto m = parse_ok("x.Call(f(a, b), []int{1, 2}, `raw, text`)\n");
  ASSERT_EQ(m.calls.front().member, "Call");
  const auto& args = m.calls.front().args;
  ASSERT_EQ(args.size(), 3u);
  ASSERT_EQ(args[0].text, "f(a, b)");
  ASSERT_EQ(args[1].text, "[]int{1, 2}");
  ASSERT_TRUE(args[2].is_string_literal);
  ASSERT_EQ(args[2].text, "raw, text");
}

TEST(field_refs_use_plain_left_side) {
  auto m = parse_ok(
      "func run(cfg *Config) {\n"
      "\tif cfg.Verbose { log(c.Quiet) }\n"
      "\tx := a.b.Deep\n"
      "\tp->field = 1\n"
      "}\n");
  ASSERT_TRUE(m.references({"cfg"}, "Verbose"));
  ASSERT_TRUE(m.references({"cfg", "c"}, "Quiet"));
  ASSERT_FALSE(m.references({"cfg"}, "Quiet"));
  ASSERT_TRUE(m.references({"a"}, "b"));
  ASSERT_FALSE(m.references({"b"}, "Deep"));
  ASSERT_TRUE(m.references({"p"}, "field"));
}

TEST(strings_and_comments_are_not_code) {
  auto m = parse_ok(
      "// cfg.Hidden is mentioned here\n"
      "/* and cfg.Block here */\n"
      "var s = \"cfg.Quoted\"\n");
  ASSERT_FALSE(m.references({"cfg"}, "Hidden"));
  ASSERT_FALSE(m.references({"cfg"}, "Block"));
  ASSERT_FALSE(m.references({"cfg"}, "Quoted"));
}

TEST(symbols_exported_and_documented) {
  auto m = parse_ok(
      "package config\n"
      "\n"
      "// Config holds settings.\n"
      "type Config struct {\n"
      "\tName string\n"
      "}\n"
      "\n"
      "func helper() {}\n"
      "\n"
      "func Undocumented() {}\n"
      "\n"
      "// Load reads the file.\n"
      "func (c *Config) Load() error { return nil }\n"
      "\n"
      "/* Multi\n"
      "   line */\n"
      "const Limit = 3\n");
  ASSERT_EQ(m.symbols.size(), 5u);
  ASSERT_EQ(m.symbols[0].name, "Config");
  ASSERT_TRUE(m.symbols[0].exported);
  ASSERT_TRUE(m.symbols[0].documented);
  ASSERT_EQ(m.symbols[0].line, 4);
  ASSERT_EQ(m.symbols[1].name, "helper");
  ASSERT_FALSE(m.symbols[1].exported);
  ASSERT_EQ(m.symbols[2].name, "Undocumented");
  ASSERT_FALSE(m.symbols[2].documented);
  ASSERT_EQ(m.symbols[3].name, "Load");
  ASSERT_TRUE(m.symbols[3].documented);
  ASSERT_EQ(m.symbols[4].name, "Limit");
  ASSERT_TRUE(m.symbols[4].documented);
}

TEST(blank_line_breaks_documentation) {
  auto m = parse_ok("// Stale comment\n\nfunc Exported() {}\n");
  ASSERT_EQ(m.symbols.size(), 1u);
  ASSERT_FALSE(m.symbols[0].documented);
}

TEST(declarations_are_not_calls) {
  auto m = parse_ok("func main() {\n\trun()\n}\n");
  ASSERT_EQ(m.calls.size(), 1u);
  ASSERT_EQ(m.calls[0].member, "run");
  ASSERT_EQ(m.calls[0].receiver, "");
}

TEST(imports_single_group_and_include) {
  auto m = parse_ok(
      "import \"fmt\"\n"
      "import (\n"
      "\t\"os\"\n"
      "\tflag \"github.com/spf13/pflag\"\n"
      ")\n"
      "#include \"local.h\"\n"
      "#include <sys/stat.h>\n");
  ASSERT_EQ(m.imports, (std::vector<std::string>{"fmt", "os", "github.com/spf13/pflag", "local.h", "sys/stat.h"}));
}

TEST(malformed_input_is_rejected) {
  TokenSourceModelProvider p;
  SourceModel m;
  std::string err;
  ASSERT_FALSE(p.parse_text("var s = \"open\n", m, err));
  ASSERT_TRUE(err.find("unterminated string") != std::string::npos);
  ASSERT_FALSE(p.parse_text("/* never closed", m, err));
  ASSERT_TRUE(err.find("unterminated block comment") != std::string::npos);
  ASSERT_FALSE(p.parse_text("func f() )", m, err));
  ASSERT_FALSE(p.parse_text("func f() {", m, err));
  ASSERT_TRUE(err.find("unbalanced") != std::string::npos);
  ASSERT_TRUE(m.calls.empty());
}

TEST(parse_file_prefixes_path) {
  TokenSourceModelProvider p;
  SourceModel m;
  std::string err;
  ASSERT_FALSE(p.parse_file("/nonexistent/selfaudit/x.go", m, err));
  ASSERT_TRUE(err.find("/nonexistent/selfaudit/x.go") != std::string::npos);
}

TEST(merge_appends) {
  auto a = parse_ok("func A() {}\n");
  auto b = parse_ok("func B() { x.Y() }\n");
  a.merge(std::move(b));
  ASSERT_EQ(a.symbols.size(), 2u);
  ASSERT_EQ(a.calls.size(), 1u);
  ASSERT_TRUE(a.references({"x"}, "Y"));
}
