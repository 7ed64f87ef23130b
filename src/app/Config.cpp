#include "app/Config.hpp"
#include "util/AsciiLower.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace safere::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SAFERE_", 0) == 0) {
    alt = std::string("safere_") + n.substr(7);
  } else if (n.rfind("safere_", 0) == 0) {
    alt = std::string("SAFERE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

long long getenv_int(const char* name, long long defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  long long out = 0;
  if (safere::util::TomlReader::parse_int(v, out)) return out;
  std::fprintf(stderr, "safere: Config: ignoring non-integer %s=%s\n", name, v);
  return defv;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = std::getenv("SAFERE_CONFIG"); p && *p)
    return p;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/safere/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/safere/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default, clamped to [lo, hi].
static long long resolve_int(const safere::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, long long def,
                             long long lo, long long hi) {
  long long v = def;
  if (have_toml && toml.has(section, key)) {
    v = toml.get_int(section, key, def);
  } else if (env_name) {
    v = getenv_int(env_name, def);
  }
  if (v < lo || v > hi) {
    std::fprintf(stderr, "safere: Config: %s.%s=%lld out of range, using %lld\n", section, key, v, def);
    return def;
  }
  return v;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const safere::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string list from TOML -> env (comma separated) -> compiled default
static std::vector<std::string> resolve_list(const safere::util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name); v && *v) {
      std::vector<std::string> out;
      std::string item;
      for (const char* p = v;; ++p) {
        if (*p == ',' || *p == '\0') {
          auto b = item.find_first_not_of(" \t");
          auto e = item.find_last_not_of(" \t");
          if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
          item.clear();
          if (*p == '\0') break;
        } else {
          item.push_back(*p);
        }
      }
      return out;
    }
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c;
  safere::util::TomlReader toml;
  std::string file = path.empty() ? config_file_path() : path;
  bool have_toml = !file.empty() && toml.load(file);
  if (have_toml) {
    c.source = file;
    for (const auto& issue : toml.issues())
      std::fprintf(stderr, "safere: Config: %s:%d: %s, line ignored\n", file.c_str(), issue.line, issue.message.c_str());
  } else if (!path.empty()) {
    std::fprintf(stderr, "safere: Config: cannot read %s, using defaults\n", path.c_str());
  }

  constexpr long long kIntMax = 0x7fffffff;
  c.cache_capacity = (size_t)resolve_int(toml, have_toml, "engine", "cache_capacity",
                                         "SAFERE_CACHE_CAPACITY", 512, 1, kIntMax);
  c.max_repeat = (int)resolve_int(toml, have_toml, "engine", "max_repeat",
                                  "SAFERE_MAX_REPEAT", 65535, 1, kIntMax);
  c.replicate_limit = (int)resolve_int(toml, have_toml, "engine", "replicate_limit",
                                       "SAFERE_REPLICATE_LIMIT", 2000, 0, kIntMax);
  c.max_program_size = (int)resolve_int(toml, have_toml, "engine", "max_program_size",
                                        "SAFERE_MAX_PROGRAM_SIZE", 200000, 16, kIntMax);
  c.step_budget = (unsigned long long)resolve_int(toml, have_toml, "fallback", "step_budget",
                                                  "SAFERE_STEP_BUDGET", 10'000'000LL, 1, 0x7fffffffffffffffLL);
  c.fallback_advisory = resolve_bool(toml, have_toml, "log", "fallback_advisory", "SAFERE_FALLBACK_ADVISORY", true);
  c.verbose = resolve_bool(toml, have_toml, "log", "verbose", "SAFERE_VERBOSE", false);
  c.threads = (int)resolve_int(toml, have_toml, "columnar", "threads", "SAFERE_THREADS", 0, 0, 4096);
  c.min_rows_per_task = (size_t)resolve_int(toml, have_toml, "columnar", "min_rows_per_task",
                                            "SAFERE_MIN_ROWS_PER_TASK", 1024, 1, kIntMax);
  c.null_on_error = resolve_bool(toml, have_toml, "columnar", "null_on_error", "SAFERE_NULL_ON_ERROR", false);

  auto fns = resolve_list(toml, have_toml, "functions", "enabled", "SAFERE_FUNCTIONS", all_function_names());
  c.functions.clear();
  for (auto& f : fns) {
    std::string lower = f;
    for (auto& ch : lower) ch = (char)safere::util::ascii_lower((unsigned char)ch);
    const auto& known = all_function_names();
    if (std::find(known.begin(), known.end(), lower) == known.end()) {
      std::fprintf(stderr, "safere: Config: unknown function '%s' in functions.enabled\n", f.c_str());
      continue;
    }
    if (std::find(c.functions.begin(), c.functions.end(), lower) == c.functions.end())
      c.functions.push_back(lower);
  }

  if (c.verbose)
    std::fprintf(stderr, "safere: Config: loaded from %s\n", c.source.empty() ? "(defaults)" : c.source.c_str());
  return c;
}

const Config& config() {
  static const Config c = load_config();
  return c;
}

} // namespace safere::app
