#pragma once

#include <string_view>
#include "columnar/Column.hpp"
#include "columnar/ColumnarAdapter.hpp"
#include "ops/StringOps.hpp"
#include "regex/EngineSelector.hpp"

namespace safere::columnar {

// Column forms of the string operations. A null input row, or a null
// operand value for that row, gives a null output row. A scalar pattern is
// compiled before any row runs, so a bad pattern fails the whole call.
// Column operands must have as many rows as the input (std::invalid_argument).

[[nodiscard]] ArrayColumn split(ColumnarAdapter& adapter, const StringColumn& input, std::string_view pattern,
                                long limit = -1, regex::EngineSelector& sel = ops::default_selector());

[[nodiscard]] StringColumn regexp_replace(ColumnarAdapter& adapter, const StringColumn& input,
                                          const StringOperand& pattern, const StringOperand& replacement,
                                          regex::EngineSelector& sel = ops::default_selector());

[[nodiscard]] StringColumn regexp_extract(ColumnarAdapter& adapter, const StringColumn& input,
                                          std::string_view pattern, long idx,
                                          regex::EngineSelector& sel = ops::default_selector());

[[nodiscard]] BoolColumn rlike(ColumnarAdapter& adapter, const StringColumn& input, std::string_view pattern,
                               regex::EngineSelector& sel = ops::default_selector());

[[nodiscard]] BoolColumn startswith(ColumnarAdapter& adapter, const StringColumn& input,
                                    const StringOperand& literal,
                                    regex::EngineSelector& sel = ops::default_selector());

[[nodiscard]] BoolColumn endswith(ColumnarAdapter& adapter, const StringColumn& input,
                                  const StringOperand& literal,
                                  regex::EngineSelector& sel = ops::default_selector());

} // namespace safere::columnar
