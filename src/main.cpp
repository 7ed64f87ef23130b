#include "app/Config.hpp"
#include "columnar/ColumnarAdapter.hpp"
#include "columnar/FunctionRegistry.hpp"
#include "regex/EngineSelector.hpp"
#include "regex/Errors.hpp"
#include "util/TomlReader.hpp"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using safere::columnar::Argument;
using safere::columnar::StringColumn;

static void print_usage(std::ostream& os) {
  os << "Usage: safere [--config FILE] [--threads N] [--null-on-error] <op> <args...>\n"
        "Reads one row per stdin line and prints one result per line.\n"
        "Ops:\n"
        "  split PATTERN [LIMIT]\n"
        "  regexp_replace PATTERN REPLACEMENT\n"
        "  regexp_extract PATTERN IDX\n"
        "  rlike PATTERN\n"
        "  startswith LITERAL\n"
        "  endswith LITERAL\n"
        "  explain PATTERN      engine and program for PATTERN\n";
}

static bool parse_long(const std::string& s, long& out) {
  long long v = 0;
  if (!safere::util::TomlReader::parse_int(s, v)) return false;
  out = (long)v;
  return true;
}

// Quote for array output: backslash and double quote escaped.
static std::string quoted(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

static void print_result(const safere::columnar::Result& r) {
  if (const auto* strs = std::get_if<safere::columnar::StringColumn>(&r)) {
    for (const auto& v : *strs) std::cout << (v ? *v : "NULL") << '\n';
  } else if (const auto* bools = std::get_if<safere::columnar::BoolColumn>(&r)) {
    for (const auto& v : *bools) std::cout << (v ? (*v ? "true" : "false") : "NULL") << '\n';
  } else if (const auto* arrays = std::get_if<safere::columnar::ArrayColumn>(&r)) {
    for (const auto& v : *arrays) {
      if (!v) { std::cout << "NULL\n"; continue; }
      std::cout << '[';
      for (size_t i = 0; i < v->size(); ++i) std::cout << (i ? "," : "") << quoted((*v)[i]);
      std::cout << "]\n";
    }
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  int threads = -1;
  bool null_on_error = false;
  std::vector<std::string> rest;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (!rest.empty()) { rest.push_back(a); continue; }
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--threads" && i + 1 < argc) {
      long n = 0;
      if (!parse_long(argv[++i], n) || n < 0) {
        std::fprintf(stderr, "safere: --threads needs a non-negative integer\n");
        return 2;
      }
      threads = (int)n;
    }
    else if (a == "--null-on-error") null_on_error = true;
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
      std::fprintf(stderr, "safere: unknown option %s\n", a.c_str());
      print_usage(std::cerr);
      return 2;
    }
    else rest.push_back(a);
  }
  if (rest.empty()) { print_usage(std::cerr); return 2; }

  safere::app::Config cfg = safere::app::load_config(config_path);
  if (threads >= 0) cfg.threads = threads;
  if (null_on_error) cfg.null_on_error = true;

  safere::regex::SelectorOptions so;
  so.capacity = cfg.cache_capacity;
  so.compile = cfg.compile_options();
  so.step_budget = cfg.step_budget;
  so.fallback_advisory = cfg.fallback_advisory;
  so.verbose = cfg.verbose;
  safere::regex::EngineSelector selector(so);

  const std::string op = rest[0];
  std::vector<std::string> args(rest.begin() + 1, rest.end());

  if (op == "explain") {
    if (args.size() != 1) { print_usage(std::cerr); return 2; }
    try {
      auto re = selector.select(args[0]);
      std::cout << re->explain();
      std::cout << "groups: " << re->group_count() << '\n';
      for (const auto& [name, idx] : re->group_names()) std::cout << "  " << idx << ' ' << name << '\n';
    } catch (const safere::regex::Error& e) {
      std::fprintf(stderr, "safere: %s\n", e.what());
      return 1;
    }
    return 0;
  }

  auto registry = safere::columnar::FunctionRegistry::from_config(cfg, selector);
  const auto* fn = registry.find(op);
  if (!fn) {
    std::fprintf(stderr, "safere: unknown or disabled operation '%s'\n", op.c_str());
    return 2;
  }
  if (args.size() < fn->min_args || args.size() > fn->max_args) { print_usage(std::cerr); return 2; }

  // Integer positions: split LIMIT, regexp_extract IDX.
  std::vector<Argument> call_args;
  for (size_t i = 0; i < args.size(); ++i) {
    bool numeric = (op == "split" && i == 1) || (op == "regexp_extract" && i == 1);
    if (!numeric) { call_args.emplace_back(args[i]); continue; }
    long v = 0;
    if (!parse_long(args[i], v)) {
      std::fprintf(stderr, "safere: %s: '%s' is not an integer\n", op.c_str(), args[i].c_str());
      return 2;
    }
    call_args.emplace_back(v);
  }

  StringColumn input;
  std::string line;
  while (std::getline(std::cin, line)) input.emplace_back(line);

  safere::columnar::ColumnarAdapter adapter(safere::columnar::ColumnarAdapter::options_from(cfg));
  try {
    print_result(registry.call(op, adapter, input, call_args));
  } catch (const std::exception& e) {
    std::fprintf(stderr, "safere: %s: %s\n", op.c_str(), e.what());
    return 1;
  }
  for (const auto& err : adapter.errors())
    std::fprintf(stderr, "safere: row %zu: %s\n", err.row + 1, err.message.c_str());
  return 0;
}
