#pragma once

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "util/AsciiLower.hpp"

namespace safere::util {

// Minimal TOML subset: [section] headers, key = value lines, "quoted"
// strings, integers, booleans, flat ["a", "b"] string arrays, # comments.
// Lines it cannot read are skipped and reported through issues().
class TomlReader {
public:
  struct Issue {
    int line;
    std::string message;
  };

  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      tables_.clear();
      issues_.clear();
      return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    parse(buf.str());
    return true;
  }

  void parse(std::string_view text) {
    tables_.clear();
    issues_.clear();
    Table* table = &table_for("");
    int line_no = 0;
    for (size_t pos = 0; pos <= text.size();) {
      size_t nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      std::string_view line = trim(strip_comment(text.substr(pos, nl - pos)));
      pos = nl + 1;
      ++line_no;
      if (line.empty()) continue;

      if (line.front() == '[') {
        if (line.back() != ']' || line.size() < 3) {
          issues_.push_back({line_no, "malformed section header"});
          continue;
        }
        table = &table_for(trim(line.substr(1, line.size() - 2)));
        continue;
      }

      size_t eq = line.find('=');
      if (eq == std::string_view::npos) {
        issues_.push_back({line_no, "expected key = value"});
        continue;
      }
      std::string_view key = trim(line.substr(0, eq));
      if (key.empty()) {
        issues_.push_back({line_no, "missing key"});
        continue;
      }
      table->put(key, trim(line.substr(eq + 1)), line_no);
    }
  }

  [[nodiscard]] const std::vector<Issue>& issues() const { return issues_; }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const Value* v = lookup(section, key);
    return v ? unquote(v->raw) : def;
  }

  [[nodiscard]] long long get_int(std::string_view section, std::string_view key, long long def = 0) const {
    const Value* v = lookup(section, key);
    long long out = 0;
    return v && parse_int(v->raw, out) ? out : def;
  }

  // true/false in any letter case, or 1/0.
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const Value* v = lookup(section, key);
    if (!v) return def;
    std::string word = unquote(v->raw);
    for (auto& c : word) c = (char)ascii_lower((unsigned char)c);
    if (word == "true" || word == "1") return true;
    if (word == "false" || word == "0") return false;
    return def;
  }

  // ["a", "b"] as a list; a bare scalar is a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key,
                                                  const std::vector<std::string>& def = {}) const {
    const Value* v = lookup(section, key);
    if (!v) return def;
    std::string_view raw = v->raw;
    std::vector<std::string> out;
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
      if (!raw.empty()) out.push_back(unquote(raw));
      return out;
    }
    raw = raw.substr(1, raw.size() - 2);
    for (size_t pos = 0; pos <= raw.size();) {
      size_t comma = raw.find(',', pos);
      if (comma == std::string_view::npos) comma = raw.size();
      auto item = trim(raw.substr(pos, comma - pos));
      if (!item.empty()) out.push_back(unquote(item));
      pos = comma + 1;
    }
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return lookup(section, key) != nullptr;
  }

  // Line the key was read from, 0 when absent.
  [[nodiscard]] int line_of(std::string_view section, std::string_view key) const {
    const Value* v = lookup(section, key);
    return v ? v->line : 0;
  }

  static bool parse_int(std::string_view sv, long long& out) {
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return false;
    auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc() && p == sv.data() + sv.size();
  }

private:
  struct Value {
    std::string key;
    std::string raw;
    int line;
  };

  struct Table {
    std::string name;
    std::vector<Value> values;

    // A repeated key keeps the last value.
    void put(std::string_view key, std::string_view raw, int line) {
      for (auto& v : values) {
        if (v.key == key) {
          v.raw = std::string(raw);
          v.line = line;
          return;
        }
      }
      values.push_back({std::string(key), std::string(raw), line});
    }
  };

  std::vector<Table> tables_;
  std::vector<Issue> issues_;

  Table& table_for(std::string_view name) {
    for (auto& t : tables_)
      if (t.name == name) return t;
    tables_.push_back({std::string(name), {}});
    return tables_.back();
  }

  [[nodiscard]] const Value* lookup(std::string_view section, std::string_view key) const {
    for (const auto& t : tables_) {
      if (t.name != section) continue;
      for (const auto& v : t.values)
        if (v.key == key) return &v;
    }
    return nullptr;
  }

  static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && is_space(sv.back())) sv.remove_suffix(1);
    return sv;
  }

  // Cut a trailing # comment that is not inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"' && (i == 0 || sv[i - 1] != '\\')) quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string unquote(std::string_view val) {
    if (val.size() < 2 || val.front() != '"' || val.back() != '"') return std::string(val);
    std::string out;
    for (size_t i = 1; i + 1 < val.size(); ++i) {
      char c = val[i];
      if (c == '\\' && i + 2 < val.size()) {
        char n = val[++i];
        switch (n) {
          case 'n': out.push_back('\n'); break;
          case 't': out.push_back('\t'); break;
          default:  out.push_back(n); break;
        }
        continue;
      }
      out.push_back(c);
    }
    return out;
  }
};

} // namespace safere::util
