#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "regex/Program.hpp"

namespace safere::app {

// Names of the column functions, in registration order.
inline const std::vector<std::string>& all_function_names() {
  static const std::vector<std::string> names{
    "split", "regexp_replace", "regexp_extract", "rlike", "startswith", "endswith"};
  return names;
}

struct Config {
  // [engine]
  size_t cache_capacity{512};
  int max_repeat{65535};
  int replicate_limit{2000};
  int max_program_size{200000};
  // [fallback]
  unsigned long long step_budget{10'000'000ULL};
  // [log]
  bool fallback_advisory{true};
  bool verbose{false};
  // [columnar]
  int threads{0};                 // 0 = hardware concurrency
  size_t min_rows_per_task{1024};
  bool null_on_error{false};
  // [functions]
  std::vector<std::string> functions{all_function_names()};

  std::string source;             // file the values came from, empty if none

  [[nodiscard]] regex::CompileOptions compile_options() const {
    regex::CompileOptions o;
    o.max_repeat = max_repeat;
    o.replicate_limit = replicate_limit;
    o.max_program_size = max_program_size;
    return o;
  }
};

// Resolve every key TOML -> environment -> compiled default. An empty path
// means the default location; a missing file leaves environment and defaults.
[[nodiscard]] Config load_config(const std::string& path = "");

// Process-wide configuration, loaded once from the default location.
const Config& config();

// $SAFERE_CONFIG, else $XDG_CONFIG_HOME/safere/config.toml, else
// ~/.config/safere/config.toml. Empty if none can be formed.
std::string config_file_path();

// Environment variable helpers; the SAFERE_ and safere_ prefixes are interchangeable.
const char* getenv_compat(const char* name);
long long getenv_int(const char* name, long long defv);

} // namespace safere::app
