#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "app/Config.hpp"
#include "columnar/Column.hpp"
#include "columnar/ColumnarAdapter.hpp"
#include "regex/EngineSelector.hpp"

namespace safere::columnar {

// Arguments after the input column: a scalar string, a string column, or an
// integer (limit, group index).
using Argument = std::variant<std::string, StringColumn, long>;
using Result = std::variant<StringColumn, BoolColumn, ArrayColumn>;

struct FunctionSpec {
  std::string name;
  size_t min_args;   // excluding the input column
  size_t max_args;
  std::function<Result(ColumnarAdapter&, const StringColumn&, const std::vector<Argument>&)> fn;
};

// Column functions by name. Populated explicitly; nothing is registered
// behind the caller's back.
class FunctionRegistry {
public:
  explicit FunctionRegistry(regex::EngineSelector& sel) : sel_(sel) {}

  // Registry holding the built-ins named in c.functions.
  static FunctionRegistry from_config(const app::Config& c, regex::EngineSelector& sel);

  // Throws std::invalid_argument on a duplicate name.
  void add(FunctionSpec spec);
  // Register one of the six built-in functions by name.
  void add_builtin(std::string_view name);

  [[nodiscard]] const FunctionSpec* find(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }
  [[nodiscard]] std::vector<std::string> names() const;

  // Throws std::invalid_argument for an unknown name, a wrong argument
  // count or an argument of the wrong kind.
  [[nodiscard]] Result call(std::string_view name, ColumnarAdapter& adapter, const StringColumn& input,
                            const std::vector<Argument>& args) const;

private:
  regex::EngineSelector& sel_;
  std::vector<FunctionSpec> fns_;
};

} // namespace safere::columnar
