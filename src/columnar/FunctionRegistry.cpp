#include "columnar/FunctionRegistry.hpp"
#include "columnar/ColumnOps.hpp"
#include <stdexcept>

namespace safere::columnar {

namespace {

const std::string& text_arg(const std::vector<Argument>& args, size_t i, const char* fn) {
  if (const auto* s = std::get_if<std::string>(&args[i])) return *s;
  throw std::invalid_argument(std::string(fn) + ": argument " + std::to_string(i + 2) + " must be a string");
}

long int_arg(const std::vector<Argument>& args, size_t i, const char* fn) {
  if (const auto* v = std::get_if<long>(&args[i])) return *v;
  throw std::invalid_argument(std::string(fn) + ": argument " + std::to_string(i + 2) + " must be an integer");
}

StringOperand operand_arg(const std::vector<Argument>& args, size_t i, const char* fn) {
  if (const auto* s = std::get_if<std::string>(&args[i])) return StringOperand(*s);
  if (const auto* c = std::get_if<StringColumn>(&args[i])) return StringOperand(*c);
  throw std::invalid_argument(std::string(fn) + ": argument " + std::to_string(i + 2) +
                              " must be a string or a string column");
}

} // namespace

FunctionRegistry FunctionRegistry::from_config(const app::Config& c, regex::EngineSelector& sel) {
  FunctionRegistry r(sel);
  for (const auto& name : c.functions) r.add_builtin(name);
  return r;
}

void FunctionRegistry::add(FunctionSpec spec) {
  if (contains(spec.name)) throw std::invalid_argument("function already registered: " + spec.name);
  fns_.push_back(std::move(spec));
}

void FunctionRegistry::add_builtin(std::string_view name) {
  regex::EngineSelector* sel = &sel_;
  if (name == "split") {
    add({"split", 1, 2, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      long limit = args.size() > 1 ? int_arg(args, 1, "split") : -1;
      return split(a, in, text_arg(args, 0, "split"), limit, *sel);
    }});
  } else if (name == "regexp_replace") {
    add({"regexp_replace", 2, 2, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      return regexp_replace(a, in, operand_arg(args, 0, "regexp_replace"), operand_arg(args, 1, "regexp_replace"), *sel);
    }});
  } else if (name == "regexp_extract") {
    add({"regexp_extract", 2, 2, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      return regexp_extract(a, in, text_arg(args, 0, "regexp_extract"), int_arg(args, 1, "regexp_extract"), *sel);
    }});
  } else if (name == "rlike") {
    add({"rlike", 1, 1, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      return rlike(a, in, text_arg(args, 0, "rlike"), *sel);
    }});
  } else if (name == "startswith") {
    add({"startswith", 1, 1, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      return startswith(a, in, operand_arg(args, 0, "startswith"), *sel);
    }});
  } else if (name == "endswith") {
    add({"endswith", 1, 1, [sel](ColumnarAdapter& a, const StringColumn& in, const std::vector<Argument>& args) -> Result {
      return endswith(a, in, operand_arg(args, 0, "endswith"), *sel);
    }});
  } else {
    throw std::invalid_argument("unknown built-in function: " + std::string(name));
  }
}

const FunctionSpec* FunctionRegistry::find(std::string_view name) const {
  for (const auto& f : fns_)
    if (f.name == name) return &f;
  return nullptr;
}

std::vector<std::string> FunctionRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(fns_.size());
  for (const auto& f : fns_) out.push_back(f.name);
  return out;
}

Result FunctionRegistry::call(std::string_view name, ColumnarAdapter& adapter, const StringColumn& input,
                              const std::vector<Argument>& args) const {
  const FunctionSpec* f = find(name);
  if (!f) throw std::invalid_argument("function not registered: " + std::string(name));
  if (args.size() < f->min_args || args.size() > f->max_args)
    throw std::invalid_argument(f->name + ": expected " + std::to_string(f->min_args) +
                                (f->min_args == f->max_args ? "" : "-" + std::to_string(f->max_args)) +
                                " arguments after the input column, got " + std::to_string(args.size()));
  return f->fn(adapter, input, args);
}

} // namespace safere::columnar
