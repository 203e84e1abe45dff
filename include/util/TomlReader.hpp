#pragma once

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace selfaudit::util {

// Reader for the TOML subset used by selfaudit config files: [section] and
// [[array.of.tables]] headers, scalar keys, and string arrays (possibly
// spanning several lines). Values are kept as text and converted on access.
class TomlReader {
public:
  class Table {
  public:
    [[nodiscard]] std::string get_string(std::string_view key, const std::string& def = "") const {
      for (const auto& [k, v] : scalars_)
        if (k == key) return v;
      return def;
    }

    [[nodiscard]] int get_int(std::string_view key, int def = 0) const {
      auto val = get_string(key);
      if (val.empty()) return def;
      int out = 0;
      auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
      if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
      return out;
    }

    [[nodiscard]] double get_double(std::string_view key, double def = 0.0) const {
      auto val = get_string(key);
      if (val.empty()) return def;
      char* end = nullptr;
      double out = std::strtod(val.c_str(), &end);
      if (end != val.c_str() + val.size()) return def;
      return out;
    }

    [[nodiscard]] bool get_bool(std::string_view key, bool def = false) const {
      auto val = get_string(key);
      if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
      if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
      return def;
    }

    [[nodiscard]] std::vector<std::string> get_array(std::string_view key) const {
      for (const auto& [k, v] : arrays_)
        if (k == key) return v;
      return {};
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : scalars_)
        if (k == key) return true;
      for (const auto& [k, v] : arrays_)
        if (k == key) return true;
      return false;
    }

  private:
    friend class TomlReader;
    std::vector<std::pair<std::string, std::string>> scalars_;
    std::vector<std::pair<std::string, std::vector<std::string>>> arrays_;

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : scalars_) {
        if (k == key) { v = val; return; }
      }
      scalars_.emplace_back(key, val);
    }

    void set_array(const std::string& key, std::vector<std::string> vals) {
      for (auto& [k, v] : arrays_) {
        if (k == key) { v = std::move(vals); return; }
      }
      arrays_.emplace_back(key, std::move(vals));
    }
  };

  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  // Parses text, replacing whatever was loaded before. Malformed lines are skipped.
  void parse(std::string_view text) {
    sections_.clear();
    table_arrays_.clear();
    Table* current = &ensure_section("");
    std::string pending_key;
    std::string pending_array;
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      std::string_view raw = text.substr(pos, nl - pos);
      pos = nl + 1;

      auto sv = trim(strip_comment(raw));
      if (!pending_key.empty()) {
        pending_array.append(sv);
        pending_array.push_back(' ');
        if (array_closed(pending_array)) {
          current->set_array(pending_key, split_array(pending_array));
          pending_key.clear();
          pending_array.clear();
        }
        continue;
      }
      if (sv.empty()) continue;
      if (sv.size() > 4 && sv.substr(0, 2) == "[[" && sv.substr(sv.size() - 2) == "]]") {
        std::string name(trim(sv.substr(2, sv.size() - 4)));
        current = &append_table(name);
        continue;
      }
      if (sv.front() == '[' && sv.back() == ']') {
        std::string name(trim(sv.substr(1, sv.size() - 2)));
        current = &ensure_section(name);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto val = trim(sv.substr(eq + 1));
      if (key.empty()) continue;
      if (!val.empty() && val.front() == '[') {
        std::string acc(val);
        if (array_closed(acc)) {
          current->set_array(key, split_array(acc));
        } else {
          pending_key = key;
          pending_array = acc;
          pending_array.push_back(' ');
        }
        continue;
      }
      current->set(key, unquote(val));
    }
  }

  [[nodiscard]] const Table* section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // Every [[name]] table in file order; empty when none were declared.
  [[nodiscard]] const std::vector<Table>& tables(std::string_view name) const {
    static const std::vector<Table> none;
    for (const auto& [n, t] : table_arrays_)
      if (n == name) return t;
    return none;
  }

  [[nodiscard]] std::string get_string(std::string_view section_name, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = section(section_name);
    return s ? s->get_string(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section_name, std::string_view key, int def = 0) const {
    const auto* s = section(section_name);
    return s ? s->get_int(key, def) : def;
  }

  [[nodiscard]] double get_double(std::string_view section_name, std::string_view key, double def = 0.0) const {
    const auto* s = section(section_name);
    return s ? s->get_double(key, def) : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section_name, std::string_view key, bool def = false) const {
    const auto* s = section(section_name);
    return s ? s->get_bool(key, def) : def;
  }

  [[nodiscard]] std::vector<std::string> get_array(std::string_view section_name, std::string_view key) const {
    const auto* s = section(section_name);
    return s ? s->get_array(key) : std::vector<std::string>{};
  }

  [[nodiscard]] bool has(std::string_view section_name, std::string_view key) const {
    const auto* s = section(section_name);
    return s && s->has(key);
  }

private:
  std::vector<std::pair<std::string, Table>> sections_;
  std::vector<std::pair<std::string, std::vector<Table>>> table_arrays_;

  Table& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Table{});
    return sections_.back().second;
  }

  Table& append_table(const std::string& name) {
    for (auto& [n, t] : table_arrays_) {
      if (n == name) { t.emplace_back(); return t.back(); }
    }
    table_arrays_.emplace_back(name, std::vector<Table>(1));
    return table_arrays_.back().second.back();
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing '#' comment that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    char quote = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (quote) {
        if (c == '\\' && quote == '"') { ++i; continue; }
        if (c == quote) quote = 0;
      } else if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '#') {
        return sv.substr(0, i);
      }
    }
    return sv;
  }

  static bool array_closed(std::string_view sv) {
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (quote) {
        if (c == '\\' && quote == '"') { ++i; continue; }
        if (c == quote) quote = 0;
        continue;
      }
      if (c == '"' || c == '\'') quote = c;
      else if (c == '[') ++depth;
      else if (c == ']') { if (--depth == 0) return true; }
    }
    return false;
  }

  static std::vector<std::string> split_array(std::string_view sv) {
    std::vector<std::string> out;
    auto open = sv.find('[');
    auto close = sv.rfind(']');
    if (open == std::string_view::npos || close == std::string_view::npos || close <= open) return out;
    auto body = sv.substr(open + 1, close - open - 1);
    std::string item;
    char quote = 0;
    auto flush = [&]{
      auto t = trim(item);
      if (!t.empty()) out.push_back(unquote(t));
      item.clear();
    };
    for (size_t i = 0; i < body.size(); ++i) {
      char c = body[i];
      if (quote) {
        item.push_back(c);
        if (c == '\\' && quote == '"' && i + 1 < body.size()) { item.push_back(body[++i]); continue; }
        if (c == quote) quote = 0;
        continue;
      }
      if (c == '"' || c == '\'') { quote = c; item.push_back(c); continue; }
      if (c == ',') { flush(); continue; }
      item.push_back(c);
    }
    flush();
    return out;
  }

  static std::string unquote(std::string_view val) {
    if (val.size() >= 2 && val.front() == '\'' && val.back() == '\'')
      return std::string(val.substr(1, val.size() - 2));
    if (val.size() < 2 || val.front() != '"' || val.back() != '"') return std::string(val);
    std::string out;
    auto body = val.substr(1, val.size() - 2);
    for (size_t i = 0; i < body.size(); ++i) {
      char c = body[i];
      if (c != '\\' || i + 1 == body.size()) { out.push_back(c); continue; }
      char n = body[++i];
      switch (n) {
        case 'n': out.push_back('\n'); break;
        case 't': out.push_back('\t'); break;
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        default: out.push_back('\\'); out.push_back(n); break;
      }
    }
    return out;
  }
};

} // namespace selfaudit::util
