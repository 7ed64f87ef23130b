#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace safere::columnar {

// Nullable column: one optional value per row.
template <class T>
using Column = std::vector<std::optional<T>>;

using StringColumn = Column<std::string>;
using BoolColumn   = Column<bool>;
using ArrayColumn  = Column<std::vector<std::string>>;

// A string argument that is either one value shared by every row or a
// column of per-row values. A null scalar makes every row null.
class StringOperand {
public:
  StringOperand(std::string scalar) : scalar_(true), value_(std::move(scalar)) {}
  StringOperand(const char* scalar) : scalar_(true), value_(std::string(scalar)) {}
  StringOperand(StringColumn column) : scalar_(false), column_(std::move(column)) {}

  static StringOperand null_scalar() {
    StringOperand o{std::string()};
    o.value_.reset();
    return o;
  }

  [[nodiscard]] bool is_scalar() const { return scalar_; }
  [[nodiscard]] const std::optional<std::string>& scalar() const { return value_; }
  [[nodiscard]] const StringColumn& column() const { return column_; }
  // Rows in a column operand; a scalar fits any row count.
  [[nodiscard]] size_t size() const { return column_.size(); }

  [[nodiscard]] const std::optional<std::string>& at(size_t row) const {
    return scalar_ ? value_ : column_[row];
  }

private:
  bool scalar_;
  std::optional<std::string> value_;
  StringColumn column_;
};

} // namespace safere::columnar
