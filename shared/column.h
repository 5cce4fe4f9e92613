#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "binomial.h"
#include "entry.h"
#include "errors.h"
#include "numeric.h"

namespace pascal {

// The top-most entries of a column of Pascal's triangle: C(n, colnum) for
// n = colnum .. colnum+size-1. Indexing is by row number, so the first
// valid index is colnum.
template <typename V = std::int64_t>
class Column {
 public:
  using value_type = V;

  // Calculates the first size values, stepping down the column.
  Column(int colnum, int size) : colnum_(colnum) {
    check_colnum(colnum);
    if (size < 0) {
      throw std::domain_error(
          std::format("size must be nonnegative, size: {}", size));
    }
    data_.reserve(size);
    Entry<V> entry(colnum, colnum, V(1));
    for (int i = 0; i < size; ++i) {
      if (i > 0) {
        entry.move_down();
      }
      data_.push_back(entry.value());
    }
  }

  // The values are taken as given and not checked.
  Column(int colnum, std::vector<V> data)
      : colnum_(colnum), data_(std::move(data)) {
    check_colnum(colnum);
  }

  int column_number() const { return colnum_; }
  int size() const { return static_cast<int>(data_.size()); }
  int first_index() const { return colnum_; }
  int last_index() const { return colnum_ + size() - 1; }
  const std::vector<V> &values() const { return data_; }

  // C(i, colnum)
  const V &operator[](int i) const {
    if (i < first_index() || i > last_index()) {
      throw std::out_of_range(std::format(
          "index {} out of range {}:{} of column {}", i, first_index(),
          last_index(), colnum_));
    }
    return data_[i - colnum_];
  }

  std::vector<Entry<V>> to_array() const {
    std::vector<Entry<V>> result;
    result.reserve(data_.size());
    for (int i = 0; i < size(); ++i) {
      result.emplace_back(colnum_ + i, colnum_, data_[i]);
    }
    return result;
  }

  bool is_first() const { return colnum_ == 0; }
  bool is_at_left() const { return is_first(); }

  // Compares the values against exact binomial coefficients. This is slow.
  bool is_valid() const {
    if (colnum_ < 0) {
      return false;
    }
    for (int i = 0; i < size(); ++i) {
      if (!is_exact_binomial(data_[i], colnum_ + i, colnum_)) {
        return false;
      }
    }
    return true;
  }

  // Moves to column colnum+1, keeping the same number of values.
  // C(n+1, k+1) = C(n, k) + C(n, k+1), and the new value below has
  // already been updated when it is read.
  Column &advance() {
    if constexpr (std::is_integral_v<V>) {
      // The last new value is the sum of all the old ones and is the
      // largest, so checking it before anything changes covers the rest.
      V total(0);
      for (const V &value : data_) {
        total = checked_add(total, value);
      }
    }
    for (std::size_t i = 1; i < data_.size(); ++i) {
      data_[i] += data_[i - 1];
    }
    colnum_ += 1;
    return *this;
  }

  // Moves to column colnum-1, keeping the same number of values.
  Column &retreat() {
    if (is_first()) {
      throw OutOfBoundsError("no previous column");
    }
    for (std::size_t i = data_.size(); i-- > 1;) {
      data_[i] -= data_[i - 1];
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
  std::vector<V> data_;
};

template <typename V, typename U>
bool operator==(const Column<V> &a, const Column<U> &b) {
  if (a.column_number() != b.column_number() || a.size() != b.size()) {
    return false;
  }
  for (int i = 0; i < a.size(); ++i) {
    if (!numerically_equal(a.values()[i], b.values()[i])) {
      return false;
    }
  }
  return true;
}

template <typename V>
std::ostream &operator<<(std::ostream &os, const Column<V> &c) {
  os << "Column(" << c.column_number() << ")[";
  for (int i = 0; i < c.size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << c.values()[i];
  }
  return os << "]";
}

}  // namespace pascal
