#include "source/SourceModel.hpp"

#include <algorithm>
#include <cctype>

#include "util/FileIO.hpp"

namespace selfaudit::source {

bool SourceModel::references(const std::vector<std::string>& receivers, std::string_view field) const {
  return std::any_of(field_refs.begin(), field_refs.end(), [&](const FieldRef& r) {
    if (r.field != field) return false;
    return std::find(receivers.begin(), receivers.end(), r.receiver) != receivers.end();
  });
}

void SourceModel::merge(SourceModel&& other) {
  auto append = [](auto& dst, auto& src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
  };
  append(symbols, other.symbols);
  append(calls, other.calls);
  append(field_refs, other.field_refs);
  append(imports, other.imports);
}

bool ISourceModelProvider::parse_file(const std::filesystem::path& path, SourceModel& out, std::string& err) {
  auto text = util::read_file_string(path);
  if (!text) {
    err = "cannot read " + path.string();
    return false;
  }
  std::string why;
  if (!parse_text(*text, out, why)) {
    err = path.string() + ": " + why;
    return false;
  }
  return true;
}

namespace {

enum class Tok { Ident, String, Char, Number, Punct };

struct Token {
  Tok kind;
  std::string text;    // unquoted value for String
  size_t begin{0};     // source span
  size_t end{0};
  int line{1};
  int comment_before{0};  // last line of a comment ending right before this token, 0 if none
};

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Splits text into tokens; false on an unterminated string or comment.
bool tokenize(std::string_view s, std::vector<Token>& out, std::string& err) {
  int line = 1;
  int last_comment_line = 0;
  size_t i = 0;
  auto push = [&](Tok k, std::string text, size_t b, size_t e, int ln) {
    out.push_back(Token{k, std::move(text), b, e, ln, last_comment_line});
    last_comment_line = 0;
  };
  while (i < s.size()) {
    char c = s[i];
    if (c == '\n') { ++line; ++i; continue; }
    if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

    if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
      while (i < s.size() && s[i] != '\n') ++i;
      last_comment_line = line;
      continue;
    }
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
      int start_line = line;
      auto close = s.find("*/", i + 2);
      if (close == std::string_view::npos) {
        err = "line " + std::to_string(start_line) + ": unterminated block comment";
        return false;
      }
      line += static_cast<int>(std::count(s.begin() + static_cast<long>(i), s.begin() + static_cast<long>(close), '\n'));
      i = close + 2;
      last_comment_line = line;
      continue;
    }
    if (c == '"' || c == '\'') {
      size_t b = i++;
      std::string val;
      bool closed = false;
      while (i < s.size()) {
        char d = s[i];
        if (d == '\n') break;
        if (d == '\\' && i + 1 < s.size()) {
          char n = s[i + 1];
          switch (n) {
            case 'n': val.push_back('\n'); break;
            case 't': val.push_back('\t'); break;
            default: val.push_back(n); break;
          }
          i += 2;
          continue;
        }
        if (d == c) { closed = true; ++i; break; }
        val.push_back(d);
        ++i;
      }
      if (!closed) {
        err = "line " + std::to_string(line) + ": unterminated string literal";
        return false;
      }
      push(c == '"' ? Tok::String : Tok::Char, std::move(val), b, i, line);
      continue;
    }
    if (c == '`') {
      size_t b = i;
      int start_line = line;
      auto close = s.find('`', i + 1);
      if (close == std::string_view::npos) {
        err = "line " + std::to_string(start_line) + ": unterminated raw string";
        return false;
      }
      std::string val(s.substr(i + 1, close - i - 1));
      line += static_cast<int>(std::count(val.begin(), val.end(), '\n'));
      i = close + 1;
      push(Tok::String, std::move(val), b, i, start_line);
      continue;
    }
    if (is_ident_start(c)) {
      size_t b = i;
      while (i < s.size() && is_ident_char(s[i])) ++i;
      push(Tok::Ident, std::string(s.substr(b, i - b)), b, i, line);
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      size_t b = i;
      while (i < s.size() && (is_ident_char(s[i]) || s[i] == '.')) ++i;
      push(Tok::Number, std::string(s.substr(b, i - b)), b, i, line);
      continue;
    }
    if (c == '-' && i + 1 < s.size() && s[i + 1] == '>') {
      push(Tok::Punct, "->", i, i + 2, line);
      i += 2;
      continue;
    }
    push(Tok::Punct, std::string(1, c), i, i + 1, line);
    ++i;
  }
  return true;
}

bool is_selector(const Token& t) {
  return t.kind == Tok::Punct && (t.text == "." || t.text == "->");
}

bool is_punct(const Token& t, char c) {
  return t.kind == Tok::Punct && t.text.size() == 1 && t.text[0] == c;
}

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Parses the argument list whose '(' is at toks[open]. Returns the index of
// the matching ')' or toks.size() if unbalanced.
size_t split_args(std::string_view src, const std::vector<Token>& toks, size_t open, std::vector<CallArg>& args) {
  int depth = 0;
  size_t arg_begin = open + 1;
  auto flush = [&](size_t end_tok) {
    if (end_tok == arg_begin) return;
    CallArg a;
    if (end_tok - arg_begin == 1 && toks[arg_begin].kind == Tok::String) {
      a.is_string_literal = true;
      a.text = toks[arg_begin].text;
    } else {
      auto b = toks[arg_begin].begin;
      auto e = toks[end_tok - 1].end;
      a.text = std::string(trim(src.substr(b, e - b)));
    }
    args.push_back(std::move(a));
  };
  for (size_t j = open; j < toks.size(); ++j) {
    const auto& t = toks[j];
    if (t.kind != Tok::Punct) continue;
    if (t.text == "(" || t.text == "[" || t.text == "{") { ++depth; continue; }
    if (t.text == ")" || t.text == "]" || t.text == "}") {
      if (--depth == 0) { flush(j); return j; }
      continue;
    }
    if (t.text == "," && depth == 1) {
      flush(j);
      arg_begin = j + 1;
    }
  }
  return toks.size();
}

bool is_decl_keyword(const std::string& w) {
  static const char* kw[] = {"func", "type", "var", "const", "class", "struct", "enum", "interface"};
  for (const char* k : kw) if (w == k) return true;
  return false;
}

} // namespace

bool TokenSourceModelProvider::parse_text(std::string_view text, SourceModel& out, std::string& err) {
  std::vector<Token> toks;
  if (!tokenize(text, toks, err)) return false;

  SourceModel model;
  int depth = 0;
  bool in_import_group = false;
  for (size_t i = 0; i < toks.size(); ++i) {
    const auto& t = toks[i];

    if (t.kind == Tok::Punct) {
      if (t.text == "(" || t.text == "{" || t.text == "[") ++depth;
      else if (t.text == ")" || t.text == "}" || t.text == "]") {
        if (--depth < 0) {
          err = "line " + std::to_string(t.line) + ": unbalanced '" + t.text + "'";
          return false;
        }
        if (in_import_group && t.text == ")") in_import_group = false;
      } else if (t.text == "#" && i + 1 < toks.size() && toks[i + 1].text == "include") {
        // #include "x" or #include <x/y.h>
        if (i + 2 < toks.size() && toks[i + 2].kind == Tok::String) {
          model.imports.push_back(toks[i + 2].text);
        } else if (i + 2 < toks.size() && is_punct(toks[i + 2], '<')) {
          size_t j = i + 3;
          while (j < toks.size() && !is_punct(toks[j], '>') && toks[j].line == t.line) ++j;
          if (j < toks.size() && is_punct(toks[j], '>')) {
            auto b = toks[i + 2].end;
            model.imports.emplace_back(text.substr(b, toks[j].begin - b));
          }
        }
      }
      continue;
    }

    if (t.kind == Tok::String && in_import_group) {
      model.imports.push_back(t.text);
      continue;
    }
    if (t.kind != Tok::Ident) continue;

    if (t.text == "import" && depth == 0) {
      if (i + 1 < toks.size() && toks[i + 1].kind == Tok::String) {
        model.imports.push_back(toks[i + 1].text);
      } else if (i + 1 < toks.size() && is_punct(toks[i + 1], '(')) {
        in_import_group = true;
      }
      continue;
    }

    if (depth == 0 && is_decl_keyword(t.text)) {
      size_t j = i + 1;
      // Skip a method receiver: func (r *T) Name(
      if (t.text == "func" && j < toks.size() && is_punct(toks[j], '(')) {
        int d = 0;
        for (; j < toks.size(); ++j) {
          if (is_punct(toks[j], '(')) ++d;
          else if (is_punct(toks[j], ')') && --d == 0) { ++j; break; }
        }
      }
      if (j < toks.size() && toks[j].kind == Tok::Ident) {
        Symbol sym;
        sym.name = toks[j].text;
        sym.line = toks[j].line;
        sym.exported = std::isupper(static_cast<unsigned char>(sym.name.front())) != 0;
        sym.documented = t.comment_before != 0 && t.comment_before >= t.line - 1;
        model.symbols.push_back(std::move(sym));
        i = j;
      }
      continue;
    }

    // receiver.member and receiver.member(...)
    if (i + 2 < toks.size() && is_selector(toks[i + 1]) && toks[i + 2].kind == Tok::Ident) {
      bool plain_left = i == 0 || !is_selector(toks[i - 1]);
      const auto& member = toks[i + 2];
      if (plain_left) model.field_refs.push_back(FieldRef{t.text, member.text, member.line});
      if (i + 3 < toks.size() && is_punct(toks[i + 3], '(')) {
        Call call{t.text, member.text, {}, member.line};
        split_args(text, toks, i + 3, call.args);
        model.calls.push_back(std::move(call));
      }
      continue;
    }

    // bare call: name(...), unless it is itself the member of a selector
    if (i + 1 < toks.size() && is_punct(toks[i + 1], '(') && (i == 0 || !is_selector(toks[i - 1]))) {
      Call call{"", t.text, {}, t.line};
      split_args(text, toks, i + 1, call.args);
      model.calls.push_back(std::move(call));
    }
  }
  if (depth != 0) {
    err = "unexpected end of input: unbalanced brackets";
    return false;
  }
  out.merge(std::move(model));
  return true;
}

} // namespace selfaudit::source
