#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <map>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "binomial.h"
#include "column.h"
#include "entry.h"
#include "errors.h"
#include "numeric.h"

namespace pascal {

// A whole column of Pascal's triangle, C(n, colnum) for n >= colnum,
// calculated only as values are requested. Like Column it is indexed by row
// number.
//
// Values are cached by offset from the top of the column, starting at 1.
// The cache only grows; nothing is ever evicted.
template <typename V = std::int64_t>
class LazyColumn {
 public:
  using value_type = V;

  explicit LazyColumn(int colnum) : colnum_(colnum), data_{{1, V(1)}} {
    check_colnum(colnum);
  }

  // The cached values are taken as given and not checked.
  LazyColumn(int colnum, std::map<int, V> data)
      : colnum_(colnum), data_(std::move(data)) {
    check_colnum(colnum);
    if (!data_.empty() && data_.begin()->first < 1) {
      throw std::invalid_argument("LazyColumn offsets start at 1");
    }
  }

  explicit LazyColumn(const Column<V> &column)
      : colnum_(column.column_number()) {
    for (int i = 0; i < column.size(); ++i) {
      data_.emplace(i + 1, column.values()[i]);
    }
  }

  int column_number() const { return colnum_; }
  int first_index() const { return colnum_; }
  const std::map<int, V> &cached() const { return data_; }
  bool is_cached(int i) const { return data_.contains(i - colnum_ + 1); }

  // C(i, colnum). A value not yet cached is calculated directly and then
  // its neighbours are filled in by moving up and down the column.
  V operator[](int i) {
    if (i < colnum_) {
      throw std::out_of_range(std::format(
          "index {} out of range for column {}", i, colnum_));
    }
    const int offset = i - colnum_ + 1;
    const auto found = data_.find(offset);
    if (found != data_.end()) {
      return found->second;
    }

    const Entry<V> entry(i, colnum_);
    Entry<V> a = entry;
    for (int j = offset - 1; j >= std::max(1, offset - precalc_number); --j) {
      a.move_up();
      data_.try_emplace(j, a.value());
    }
    a = entry;
    try {
      for (int j = offset + 1; j <= offset + precalc_number; ++j) {
        a.move_down();
        data_.try_emplace(j, a.value());
      }
    } catch (const std::overflow_error &) {
      // Values further down do not fit in V; they are left uncached.
    }
    data_.emplace(offset, entry.value());
    return entry.value();
  }

  // The cached values only, in row order.
  std::vector<Entry<V>> to_array() const {
    std::vector<Entry<V>> result;
    result.reserve(data_.size());
    for (const auto &[offset, value] : data_) {
      result.emplace_back(colnum_ + offset - 1, colnum_, value);
    }
    return result;
  }

  bool is_first() const { return colnum_ == 0; }
  bool is_at_left() const { return is_first(); }

  // Checks every cached value against the exact binomial coefficient.
  bool is_valid() const {
    if (colnum_ < 0) {
      return false;
    }
    return std::all_of(data_.begin(), data_.end(), [this](const auto &p) {
      return is_exact_binomial(p.second, colnum_ + p.first - 1, colnum_);
    });
  }

  // Moves to column colnum+1. Each cached value moves down and to the
  // right, keeping its offset; nothing new is calculated.
  LazyColumn &advance() {
    std::map<int, V> next = data_;
    for (auto &[offset, value] : next) {
      // The top of every column is 1.
      if (offset == 1) {
        continue;
      }
      const Entry<V> entry(colnum_ + offset - 1, colnum_, value);
      Entry<V> right = entry;
      right.move_right();
      value = (entry + right).value();
    }
    data_.swap(next);
    colnum_ += 1;
    return *this;
  }

  // Moves to column colnum-1. Each cached value moves up and to the left,
  // which is a single step up from its mirror image C(r, r-colnum).
  LazyColumn &retreat() {
    if (is_first()) {
      throw OutOfBoundsError("no previous column");
    }
    for (auto &[offset, value] : data_) {
      const int r = colnum_ + offset - 1;
      Entry<V> mirror(r, r - colnum_, value);
      mirror.move_up();
      value = mirror.value();
    }
    colnum_ -= 1;
    return *this;
  }

 private:
  static void check_colnum(int colnum) {
    if (colnum < 0) {
      throw std::domain_error(
          std::format("colnum must be nonnegative, colnum: {}", colnum));
    }
  }

  int colnum_;
  std::map<int, V> data_;
};

// The leading values of a lazy column that have been calculated without
// gaps.
template <typename V>
Column<V> to_column(const LazyColumn<V> &column) {
  std::vector<V> data;
  const auto &cached = column.cached();
  for (int offset = 1;; ++offset) {
    const auto found = cached.find(offset);
    if (found == cached.end()) {
      break;
    }
    data.push_back(found->second);
  }
  return Column<V>(column.column_number(), std::move(data));
}

// Lazy columns are equal when they are the same column and have cached the
// same values.
template <typename V, typename U>
bool operator==(const LazyColumn<V> &a, const LazyColumn<U> &b) {
  if (a.column_number() != b.column_number() ||
      a.cached().size() != b.cached().size()) {
    return false;
  }
  auto it = b.cached().begin();
  for (const auto &[offset, value] : a.cached()) {
    if (offset != it->first || !numerically_equal(value, it->second)) {
      return false;
    }
    ++it;
  }
  return true;
}

template <typename V>
std::ostream &operator<<(std::ostream &os, const LazyColumn<V> &c) {
  os << "LazyColumn(" << c.column_number() << "){";
  bool first = true;
  for (const auto &[offset, value] : c.cached()) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << c.column_number() + offset - 1 << " => " << value;
  }
  return os << "}";
}

}  // namespace pascal
