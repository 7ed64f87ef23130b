#include "minitest.hpp"
#include "columnar/ColumnOps.hpp"
#include "columnar/FunctionRegistry.hpp"
#include "regex/Errors.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace safere::columnar;
using safere::regex::EngineSelector;
using safere::regex::PatternSyntaxError;
using safere::regex::SelectorOptions;

static SelectorOptions quiet() {
  SelectorOptions o;
  o.fallback_advisory = false;
  return o;
}

static AdapterOptions parallel(int threads, size_t min_rows, ErrorPolicy policy = ErrorPolicy::Abort) {
  AdapterOptions o;
  o.threads = threads;
  o.min_rows_per_task = min_rows;
  o.policy = policy;
  return o;
}

// ============================================================================
// ADAPTER
// ============================================================================

TEST(adapter_worker_count) {
  ColumnarAdapter a(parallel(4, 1024));
  ASSERT_EQ(a.workers_for(0), 1u);
  ASSERT_EQ(a.workers_for(100), 1u);
  ASSERT_EQ(a.workers_for(2048), 2u);
  ASSERT_EQ(a.workers_for(5000), 4u);
}

TEST(adapter_options_from_config) {
  safere::app::Config c;
  c.threads = 3;
  c.min_rows_per_task = 10;
  c.null_on_error = true;
  auto o = ColumnarAdapter::options_from(c);
  ASSERT_EQ(o.threads, 3);
  ASSERT_EQ(o.min_rows_per_task, 10u);
  ASSERT_TRUE(o.policy == ErrorPolicy::NullRow);
}

TEST(adapter_preserves_row_order) {
  EngineSelector sel(quiet());
  ColumnarAdapter a(parallel(4, 16));
  StringColumn in;
  for (int i = 0; i < 1000; ++i) in.emplace_back("row-" + std::to_string(i));
  auto out = regexp_extract(a, in, "(\\d+)", 1, sel);
  ASSERT_EQ(out.size(), 1000u);
  for (int i = 0; i < 1000; ++i) ASSERT_EQ(*out[(size_t)i], std::to_string(i));
}

TEST(adapter_abort_rethrows_lowest_row) {
  ColumnarAdapter a(parallel(4, 2));
  try {
    (void)a.map<int>(10, [](size_t row) -> std::optional<int> {
      if (row == 3 || row == 7) throw std::runtime_error("row " + std::to_string(row));
      return (int)row;
    });
    ASSERT_TRUE(false);
  } catch (const std::runtime_error& e) {
    ASSERT_EQ(std::string(e.what()), "row 3");
  }
}

TEST(adapter_null_row_records_errors) {
  ColumnarAdapter a(parallel(4, 2, ErrorPolicy::NullRow));
  auto out = a.map<int>(10, [](size_t row) -> std::optional<int> {
    if (row == 3 || row == 7) throw std::runtime_error("boom");
    return (int)row * 2;
  });
  ASSERT_TRUE(!out[3].has_value());
  ASSERT_TRUE(!out[7].has_value());
  ASSERT_EQ(*out[9], 18);
  ASSERT_EQ(a.errors().size(), 2u);
  ASSERT_EQ(a.errors()[0].row, 3u);
  ASSERT_EQ(a.errors()[1].row, 7u);
  ASSERT_EQ(a.errors()[0].message, "boom");

  // errors() belongs to the latest call
  (void)a.map<int>(4, [](size_t row) -> std::optional<int> { return (int)row; });
  ASSERT_TRUE(a.errors().empty());
}

// ============================================================================
// COLUMN OPERATIONS
// ============================================================================

TEST(column_nulls_propagate) {
  EngineSelector sel(quiet());
  ColumnarAdapter a;
  StringColumn in{"a,b", std::nullopt, ""};

  auto parts = split(a, in, ",", -1, sel);
  ASSERT_EQ(*parts[0], (std::vector<std::string>{"a", "b"}));
  ASSERT_TRUE(!parts[1].has_value());
  ASSERT_EQ(*parts[2], (std::vector<std::string>{""}));

  ASSERT_EQ(rlike(a, in, "b", sel), (BoolColumn{true, std::nullopt, false}));
  ASSERT_EQ(regexp_extract(a, in, "(z)", 1, sel), (StringColumn{"", std::nullopt, ""}));
}

TEST(column_null_scalar_operand_nulls_every_row) {
  EngineSelector sel(quiet());
  ColumnarAdapter a;
  StringColumn in{"x", "y"};
  auto out = regexp_replace(a, in, StringOperand::null_scalar(), "z", sel);
  ASSERT_EQ(out, (StringColumn{std::nullopt, std::nullopt}));
  auto sw = startswith(a, in, StringOperand::null_scalar(), sel);
  ASSERT_EQ(sw, (BoolColumn{std::nullopt, std::nullopt}));
}

TEST(column_operands_per_row) {
  EngineSelector sel(quiet());
  ColumnarAdapter a;
  StringColumn in{"2024-01-02", "abc", "abc", std::nullopt};
  StringColumn pats{"\\d+", "b", std::nullopt, "x"};
  StringColumn repl{"#", std::nullopt, "_", "_"};
  auto out = regexp_replace(a, in, pats, repl, sel);
  ASSERT_EQ(out, (StringColumn{"#-#-#", std::nullopt, std::nullopt, std::nullopt}));

  StringColumn words{"abc.def", "x.txt", std::nullopt};
  StringColumn lits{"abc.", ".txt", "a"};
  ASSERT_EQ(startswith(a, words, lits, sel), (BoolColumn{true, false, std::nullopt}));
  ASSERT_EQ(endswith(a, words, lits, sel), (BoolColumn{false, true, std::nullopt}));
}

TEST(column_length_mismatch_rejected) {
  EngineSelector sel(quiet());
  ColumnarAdapter a;
  StringColumn in{"a", "b", "c"};
  StringColumn pats{"a", "b"};
  ASSERT_THROWS(regexp_replace(a, in, pats, "x", sel), std::invalid_argument);
  ASSERT_THROWS(endswith(a, in, pats, sel), std::invalid_argument);
}

TEST(column_scalar_pattern_fails_whole_call) {
  EngineSelector sel(quiet());
  ColumnarAdapter a;
  StringColumn empty;
  ASSERT_THROWS(rlike(a, empty, "(", sel), PatternSyntaxError);
  ASSERT_THROWS(regexp_replace(a, empty, "[", "x", sel), PatternSyntaxError);
}

TEST(column_row_pattern_errors_follow_policy) {
  EngineSelector sel(quiet());
  StringColumn in(10, std::optional<std::string>("aa"));
  StringColumn pats(10, std::optional<std::string>("a"));
  pats[3] = "(";
  pats[7] = "[";

  ColumnarAdapter abort_adapter(parallel(4, 2));
  try {
    (void)regexp_replace(abort_adapter, in, pats, "b", sel);
    ASSERT_TRUE(false);
  } catch (const PatternSyntaxError& e) {
    ASSERT_EQ(e.pattern(), "(");
  }

  ColumnarAdapter null_adapter(parallel(4, 2, ErrorPolicy::NullRow));
  auto out = regexp_replace(null_adapter, in, pats, "b", sel);
  ASSERT_EQ(*out[0], "bb");
  ASSERT_TRUE(!out[3].has_value());
  ASSERT_TRUE(!out[7].has_value());
  ASSERT_EQ(null_adapter.errors().size(), 2u);
  ASSERT_EQ(null_adapter.errors()[1].row, 7u);
}

// ============================================================================
// FUNCTION REGISTRY
// ============================================================================

TEST(registry_from_config) {
  EngineSelector sel(quiet());
  safere::app::Config c;
  c.functions = {"rlike", "split"};
  auto reg = FunctionRegistry::from_config(c, sel);
  ASSERT_EQ(reg.names(), (std::vector<std::string>{"rlike", "split"}));
  ASSERT_TRUE(reg.contains("split"));
  ASSERT_TRUE(!reg.contains("regexp_replace"));

  ColumnarAdapter a;
  ASSERT_THROWS(reg.call("regexp_replace", a, StringColumn{"x"}, {std::string("x"), std::string("y")}),
                std::invalid_argument);
}

TEST(registry_default_config_has_all_functions) {
  EngineSelector sel(quiet());
  auto reg = FunctionRegistry::from_config(safere::app::Config{}, sel);
  ASSERT_EQ(reg.names(), safere::app::all_function_names());
}

TEST(registry_calls_dispatch) {
  EngineSelector sel(quiet());
  auto reg = FunctionRegistry::from_config(safere::app::Config{}, sel);
  ColumnarAdapter a;
  StringColumn in{"a,b,c", std::nullopt};

  auto parts = std::get<ArrayColumn>(reg.call("split", a, in, {std::string(","), 2L}));
  ASSERT_EQ(*parts[0], (std::vector<std::string>{"a", "b,c"}));
  ASSERT_TRUE(!parts[1].has_value());

  auto hit = std::get<BoolColumn>(reg.call("rlike", a, in, {std::string("^a")}));
  ASSERT_EQ(hit, (BoolColumn{true, std::nullopt}));

  auto ex = std::get<StringColumn>(reg.call("regexp_extract", a, in, {std::string("(\\w),(\\w)"), 2L}));
  ASSERT_EQ(*ex[0], "b");

  auto rep = std::get<StringColumn>(reg.call("regexp_replace", a, in,
                                             {std::string(","), StringColumn{";", ";"}}));
  ASSERT_EQ(*rep[0], "a;b;c");

  auto ends = std::get<BoolColumn>(reg.call("endswith", a, in, {std::string(",c")}));
  ASSERT_EQ(*ends[0], true);
}

TEST(registry_rejects_bad_arguments) {
  EngineSelector sel(quiet());
  auto reg = FunctionRegistry::from_config(safere::app::Config{}, sel);
  ColumnarAdapter a;
  StringColumn in{"x"};
  ASSERT_THROWS(reg.call("rlike", a, in, {}), std::invalid_argument);
  ASSERT_THROWS(reg.call("rlike", a, in, {std::string("x"), std::string("y")}), std::invalid_argument);
  ASSERT_THROWS(reg.call("rlike", a, in, {3L}), std::invalid_argument);
  ASSERT_THROWS(reg.call("regexp_extract", a, in, {std::string("x"), std::string("1")}), std::invalid_argument);
  ASSERT_THROWS(reg.call("nope", a, in, {}), std::invalid_argument);
}

TEST(registry_add_rules) {
  EngineSelector sel(quiet());
  FunctionRegistry reg(sel);
  ASSERT_TRUE(reg.names().empty());
  reg.add_builtin("rlike");
  ASSERT_THROWS(reg.add_builtin("rlike"), std::invalid_argument);
  ASSERT_THROWS(reg.add_builtin("upper"), std::invalid_argument);

  reg.add({"row_count", 0, 0, [](ColumnarAdapter&, const StringColumn& in, const std::vector<Argument>&) -> Result {
    return StringColumn{std::to_string(in.size())};
  }});
  ColumnarAdapter a;
  auto out = std::get<StringColumn>(reg.call("row_count", a, StringColumn{"a", "b"}, {}));
  ASSERT_EQ(*out[0], "2");
}
