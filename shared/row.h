#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <ostream>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "binomial.h"
#include "entry.h"
#include "errors.h"
#include "numeric.h"
#include "zero_range.h"

namespace pascal {

// The number of values a Row stores to represent row n.
//
// Rows are palindromes, and positions 0 and 1 always hold 1 and n, so only
// positions 2 .. n/2 are stored.
//
// With std::int64_t values the last row that fits is 66; building or
// advancing to row 67 throws std::overflow_error.
inline int row_slots(int n) { return n <= 3 ? 0 : (n - 2) / 2; }

// A complete row of Pascal's triangle, C(n,0) .. C(n,n), indexed from zero.
//
// Only row_slots(n) values are stored; everything else is derived from them
// when read. Moving to the next or previous row updates the stored values in
// place using Pascal's rule rather than recomputing them, and storage can be
// reserved up front so that advancing never reallocates.
template <typename V = std::int64_t>
class Row {
 public:
  using value_type = V;

  // Calculates the row efficiently.
  explicit Row(int rownum) : Row(rownum, rownum, 0) {}

  // The stored values are taken as given and not checked. They are the
  // values at positions 2 .. n/2; see row_slots().
  Row(int rownum, std::vector<V> data) : n_(rownum), data_(std::move(data)) {
    if (rownum < 0) {
      throw std::domain_error(
          std::format("rownum must be nonnegative, rownum: {}", rownum));
    }
    if (data_.size() < static_cast<std::size_t>(row_slots(rownum))) {
      throw std::invalid_argument("data is not enough to store the row");
    }
  }

  // Calculates row rownum with storage reserved for rows up to max_rownum.
  static Row reserved(int rownum, int max_rownum) {
    return Row(rownum, max_rownum, 0);
  }

  int row_number() const { return n_; }
  int size() const { return n_ + 1; }
  ZeroRange indices() const { return ZeroRange(n_); }
  int first_index() const { return 0; }
  int last_index() const { return n_; }

  // The values actually stored.
  std::span<const V> stored() const {
    return std::span<const V>(data_.data(), row_slots(n_));
  }

  V operator[](int i) const {
    if (i < 0 || i > n_) {
      throw std::out_of_range(
          std::format("index {} out of range for row {}", i, n_));
    }
    const int index = i > n_ / 2 ? n_ - i : i;
    if (index == 0) {
      return V(1);
    }
    if (index == 1) {
      return V(n_);
    }
    return data_[index - 2];
  }

  // The whole row, C(n,0) .. C(n,n).
  std::vector<V> values() const {
    std::vector<V> result;
    result.reserve(n_ + 1);
    for (int i = 0; i <= n_; ++i) {
      result.push_back((*this)[i]);
    }
    return result;
  }

  std::vector<Entry<V>> to_array() const {
    std::vector<Entry<V>> result;
    result.reserve(n_ + 1);
    for (int i = 0; i <= n_; ++i) {
      result.emplace_back(n_, i, (*this)[i]);
    }
    return result;
  }

  // The sum of a row is always 2**n.
  V sum() const { return power_of_two<V>(n_); }

  // The sum of f over the row, evaluating f once per stored value and
  // doubling to account for the mirrored half.
  template <typename F>
  auto sum(F f) const {
    using R = std::decay_t<std::invoke_result_t<F, const V &>>;
    const V one(1);
    if (n_ == 0) {
      return R(f(one));
    }
    const R edge = f(one);
    if (n_ == 1) {
      return R(edge + edge);
    }
    if (n_ == 2) {
      return R(edge + edge + f(V(2)));
    }
    const R second = f(V(n_));
    R s = edge + edge + second + second;
    const int length = row_slots(n_);
    for (int i = 0; i < length; ++i) {
      const R term = f(data_[i]);
      s += term;
      // The exact middle of an even row has no mirror image.
      if (i != length - 1 || n_ % 2 == 1) {
        s += term;
      }
    }
    return s;
  }

  bool is_first() const { return n_ == 0; }

  // Compares the stored values against exact binomial coefficients.
  // This is slow.
  bool is_valid() const {
    if (n_ < 0 || data_.size() < static_cast<std::size_t>(row_slots(n_))) {
      return false;
    }
    for (int i = 0; i < row_slots(n_); ++i) {
      if (!is_exact_binomial(data_[i], n_, i + 2)) {
        return false;
      }
    }
    return true;
  }

  // Moves to row n+1.
  Row &advance() {
    const int length = row_slots(n_);
    const int next_length = row_slots(n_ + 1);
    // Row n+1 may have one more distinct value. It is seeded with the value
    // at the same position in row n, which is its mirror image.
    V extra(0);
    if (next_length > length) {
      extra = n_ == 3 ? V(n_) : data_[length - 1];
    }
    if constexpr (std::is_integral_v<V>) {
      // The last slot becomes the largest value in the row, so if it fits
      // the rest do. Checked before anything changes.
      if (next_length >= 1) {
        checked_add(next_length > length ? extra : data_[next_length - 1],
                    next_length >= 2 ? data_[next_length - 2] : V(n_));
      }
    }
    if (next_length > length) {
      if (data_.size() > static_cast<std::size_t>(length)) {
        data_[length] = extra;
      } else {
        data_.push_back(extra);
      }
    }
    // Work from the top down so each value is still the old one when the
    // slot above it reads it.
    for (int i = next_length - 1; i >= 1; --i) {
      data_[i] += data_[i - 1];
    }
    if (next_length >= 1) {
      data_[0] += n_;
    }
    n_ += 1;
    return *this;
  }

  // Moves to row n-1. Storage is kept for reuse.
  Row &retreat() {
    if (is_first()) {
      throw OutOfBoundsError("no previous row");
    }
    n_ -= 1;
    const int length = row_slots(n_);
    if (length >= 1) {
      data_[0] -= n_;
      for (int i = 1; i < length; ++i) {
        data_[i] -= data_[i - 1];
      }
    }
    return *this;
  }

 private:
  Row(int rownum, int max_rownum, int) : n_(rownum) {
    if (rownum < 0) {
      throw std::domain_error(
          std::format("rownum must be nonnegative, rownum: {}", rownum));
    }
    if (max_rownum < rownum) {
      throw std::invalid_argument(
          "datasize specified is not enough to store the row");
    }
    data_.reserve(row_slots(max_rownum));
    const int length = row_slots(rownum);
    if (length >= 1) {
      // Position 1 is always n, and each step right is one multiply and
      // one divide.
      Entry<V> entry(rownum, 1, V(rownum));
      for (int i = 0; i < length; ++i) {
        entry.move_right();
        data_.push_back(entry.value());
      }
    }
  }

  int n_;
  std::vector<V> data_;
};

// Rows are equal when they are the same row and store the same values.
template <typename V, typename U>
bool operator==(const Row<V> &a, const Row<U> &b) {
  if (a.row_number() != b.row_number()) {
    return false;
  }
  const auto x = a.stored();
  const auto y = b.stored();
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (!numerically_equal(x[i], y[i])) {
      return false;
    }
  }
  return true;
}

// Long rows show only their ends.
template <typename V>
std::ostream &operator<<(std::ostream &os, const Row<V> &r) {
  static constexpr int threshold = 10;
  static constexpr int half = 4;
  os << "<";
  for (int i = 0; i <= r.row_number(); ++i) {
    if (r.row_number() >= threshold && i == half) {
      os << ", ...";
      i = r.row_number() - half + 1;
    }
    if (i > 0) {
      os << ", ";
    }
    os << r[i];
  }
  return os << ">";
}

}  // namespace pascal
