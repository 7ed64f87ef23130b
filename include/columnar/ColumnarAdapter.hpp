#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "columnar/Column.hpp"

namespace safere::columnar {

enum class ErrorPolicy {
  Abort,    // rethrow the error of the lowest failing row
  NullRow,  // null the row and record the error
};

struct RowError {
  size_t row;
  std::string message;
};

struct AdapterOptions {
  int threads{0};                 // 0 = hardware concurrency
  size_t min_rows_per_task{1024};
  ErrorPolicy policy{ErrorPolicy::Abort};
};

// Applies a per-row function over a column in parallel. Rows are split into
// contiguous chunks, one std::jthread each; every worker writes only its own
// rows, so output order always equals input order.
class ColumnarAdapter {
public:
  explicit ColumnarAdapter(AdapterOptions opts = {}) : opts_(opts) {}

  static AdapterOptions options_from(const app::Config& c);

  // fn(row) -> std::optional<Out>; nullopt is a null output row.
  // Not reentrant: errors() belongs to the most recent call.
  template <class Out, class Fn>
  Column<Out> map(size_t rows, Fn&& fn) {
    Column<Out> out(rows);
    for_each_row(rows, [&](size_t row) { out[row] = fn(row); });
    return out;
  }

  // Rows that failed during the last map() under ErrorPolicy::NullRow,
  // in row order.
  [[nodiscard]] const std::vector<RowError>& errors() const { return errors_; }
  [[nodiscard]] const AdapterOptions& options() const { return opts_; }

  // Worker count used for a column of `rows` rows.
  [[nodiscard]] size_t workers_for(size_t rows) const;

private:
  AdapterOptions opts_;
  std::vector<RowError> errors_;

  void for_each_row(size_t rows, const std::function<void(size_t)>& body);
};

} // namespace safere::columnar
