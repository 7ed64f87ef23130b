#include "columnar/ColumnarAdapter.hpp"
#include <algorithm>
#include <exception>
#include <thread>

namespace safere::columnar {

namespace {

struct Failure {
  size_t row;
  std::string message;
  std::exception_ptr error;
};

} // namespace

AdapterOptions ColumnarAdapter::options_from(const app::Config& c) {
  AdapterOptions o;
  o.threads = c.threads;
  o.min_rows_per_task = c.min_rows_per_task;
  o.policy = c.null_on_error ? ErrorPolicy::NullRow : ErrorPolicy::Abort;
  return o;
}

size_t ColumnarAdapter::workers_for(size_t rows) const {
  size_t hw = opts_.threads > 0 ? (size_t)opts_.threads : (size_t)std::thread::hardware_concurrency();
  if (hw == 0) hw = 1;
  size_t per = std::max<size_t>(opts_.min_rows_per_task, 1);
  size_t by_rows = (rows + per - 1) / per;
  return std::max<size_t>(1, std::min(hw, by_rows));
}

void ColumnarAdapter::for_each_row(size_t rows, const std::function<void(size_t)>& body) {
  errors_.clear();
  const size_t workers = workers_for(rows);
  const bool abort = opts_.policy == ErrorPolicy::Abort;
  std::vector<std::vector<Failure>> failures(workers);

  // Under Abort a worker stops at its first failure: later rows of the
  // same chunk cannot be the lowest failing row.
  auto run_chunk = [&](size_t w, size_t begin, size_t end) {
    for (size_t row = begin; row < end; ++row) {
      try {
        body(row);
      } catch (const std::exception& e) {
        failures[w].push_back({row, e.what(), std::current_exception()});
        if (abort) return;
      }
    }
  };

  if (workers == 1) {
    run_chunk(0, 0, rows);
  } else {
    const size_t chunk = (rows + workers - 1) / workers;
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
      size_t begin = std::min(rows, w * chunk);
      size_t end = std::min(rows, begin + chunk);
      pool.emplace_back([&run_chunk, w, begin, end] { run_chunk(w, begin, end); });
    }
    // jthread joins on destruction
  }

  // Chunks are in row order, so the first failure found is the lowest row.
  for (auto& list : failures) {
    for (auto& f : list) {
      if (abort) std::rethrow_exception(f.error);
      errors_.push_back({f.row, std::move(f.message)});
    }
  }
}

} // namespace safere::columnar
