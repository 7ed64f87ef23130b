#include "columnar/ColumnOps.hpp"
#include "regex/Match.hpp"
#include <stdexcept>
#include <string>

namespace safere::columnar {

namespace {

void check_rows(const StringColumn& input, const StringOperand& operand, const char* what) {
  if (!operand.is_scalar() && operand.size() != input.size())
    throw std::invalid_argument(std::string(what) + " column has " + std::to_string(operand.size()) +
                                " rows, input has " + std::to_string(input.size()));
}

// Engine for an operand row, or null when the operand value is null.
// Scalar operands resolve once, before any row runs.
class PatternSource {
public:
  PatternSource(const StringOperand& op, regex::EngineSelector& sel, bool literal)
      : op_(op), sel_(sel), literal_(literal) {
    if (op_.is_scalar() && op_.scalar()) fixed_ = resolve(*op_.scalar());
  }

  [[nodiscard]] regex::EngineHandle at(size_t row) const {
    if (op_.is_scalar()) return fixed_;
    const auto& v = op_.at(row);
    return v ? resolve(*v) : nullptr;
  }

private:
  const StringOperand& op_;
  regex::EngineSelector& sel_;
  bool literal_;
  regex::EngineHandle fixed_;

  regex::EngineHandle resolve(const std::string& text) const {
    return sel_.select(literal_ ? ops::escape(text) : text);
  }
};

BoolColumn anchored(ColumnarAdapter& adapter, const StringColumn& input, const StringOperand& literal,
                    regex::EngineSelector& sel, regex::MatchMode mode) {
  check_rows(input, literal, "literal");
  PatternSource src(literal, sel, true);
  return adapter.map<bool>(input.size(), [&](size_t row) -> std::optional<bool> {
    auto re = src.at(row);
    if (!input[row] || !re) return std::nullopt;
    return !re->run(*input[row], mode).empty();
  });
}

} // namespace

ArrayColumn split(ColumnarAdapter& adapter, const StringColumn& input, std::string_view pattern,
                  long limit, regex::EngineSelector& sel) {
  auto re = sel.select(pattern);
  return adapter.map<std::vector<std::string>>(input.size(),
      [&](size_t row) -> std::optional<std::vector<std::string>> {
        if (!input[row]) return std::nullopt;
        return ops::split(*input[row], *re, limit);
      });
}

StringColumn regexp_replace(ColumnarAdapter& adapter, const StringColumn& input,
                            const StringOperand& pattern, const StringOperand& replacement,
                            regex::EngineSelector& sel) {
  check_rows(input, pattern, "pattern");
  check_rows(input, replacement, "replacement");
  PatternSource src(pattern, sel, false);
  return adapter.map<std::string>(input.size(), [&](size_t row) -> std::optional<std::string> {
    const auto& repl = replacement.at(row);
    if (!input[row] || !repl) return std::nullopt;
    auto re = src.at(row);
    if (!re) return std::nullopt;
    return ops::regexp_replace(*input[row], *re, *repl);
  });
}

StringColumn regexp_extract(ColumnarAdapter& adapter, const StringColumn& input,
                            std::string_view pattern, long idx, regex::EngineSelector& sel) {
  auto re = sel.select(pattern);
  return adapter.map<std::string>(input.size(), [&](size_t row) -> std::optional<std::string> {
    if (!input[row]) return std::nullopt;
    return ops::regexp_extract(*input[row], *re, idx);
  });
}

BoolColumn rlike(ColumnarAdapter& adapter, const StringColumn& input, std::string_view pattern,
                 regex::EngineSelector& sel) {
  auto re = sel.select(pattern);
  return adapter.map<bool>(input.size(), [&](size_t row) -> std::optional<bool> {
    if (!input[row]) return std::nullopt;
    return ops::rlike(*input[row], *re);
  });
}

BoolColumn startswith(ColumnarAdapter& adapter, const StringColumn& input, const StringOperand& literal,
                      regex::EngineSelector& sel) {
  return anchored(adapter, input, literal, sel, regex::MatchMode::AnchoredPrefix);
}

BoolColumn endswith(ColumnarAdapter& adapter, const StringColumn& input, const StringOperand& literal,
                    regex::EngineSelector& sel) {
  return anchored(adapter, input, literal, sel, regex::MatchMode::AnchoredSuffix);
}

} // namespace safere::columnar
