#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace selfaudit::source {

struct CallArg {
  bool is_string_literal{false};
  std::string text;  // unquoted value for literals, raw source otherwise
};

// receiver.member(args...) or a bare member(args...) when receiver is empty
struct Call {
  std::string receiver;
  std::string member;
  std::vector<CallArg> args;
  int line{0};
};

// Every receiver.field selector with a plain identifier on the left,
// including the ones that are immediately called.
struct FieldRef {
  std::string receiver;
  std::string field;
  int line{0};
};

struct Symbol {
  std::string name;
  int line{0};
  bool exported{false};
  bool documented{false};  // a comment ends on the line before the declaration
};

struct SourceModel {
  std::vector<Symbol> symbols;
  std::vector<Call> calls;
  std::vector<FieldRef> field_refs;
  std::vector<std::string> imports;

  [[nodiscard]] bool references(const std::vector<std::string>& receivers, std::string_view field) const;
  void merge(SourceModel&& other);
};

// Produces a structural model of one source file.
class ISourceModelProvider {
public:
  virtual ~ISourceModelProvider() = default;

  [[nodiscard]] virtual bool parse_text(std::string_view text, SourceModel& out, std::string& err) = 0;

  // Reads path and forwards to parse_text; errors are prefixed with the path.
  [[nodiscard]] virtual bool parse_file(const std::filesystem::path& path, SourceModel& out, std::string& err);
};

// Tokenizer-based provider for C-family syntax (Go, C, C++, Java...).
// Declarations are recognized by their leading keyword: func, type, var,
// const, class, struct, enum, interface.
class TokenSourceModelProvider : public ISourceModelProvider {
public:
  bool parse_text(std::string_view text, SourceModel& out, std::string& err) override;
};

} // namespace selfaudit::source
