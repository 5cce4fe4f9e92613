#pragma once

#include <algorithm>
#include <format>
#include <map>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "binomial.h"
#include "entry.h"
#include "numeric.h"
#include "zero_range.h"

namespace pascal {

// The central elements of Pascal's triangle, C(n, n/2), for rows
// n = 0 .. maxrow. An odd row has two equal middle values; either one
// serves. Indexing is by row number.
//
// The default value type is BigInt because C(n, n/2) overflows 64 bits
// from row 67.
template <typename V = BigInt>
class Centre {
 public:
  using value_type = V;

  explicit Centre(int maxrow) {
    if (maxrow < 0) {
      throw std::domain_error(
          std::format("maxrow must be non-negative, maxrow: {}", maxrow));
    }
    data_.assign(maxrow + 1, V(1));
    if (maxrow < 2) {
      return;
    }
    Entry<V> e(2, 1, V(2));
    for (int n = 2;; ++n) {
      data_[n] = e.value();
      if (n == maxrow) {
        break;
      }
      if (n % 2 == 0) {
        // The middle of an even row sits above the left middle of the
        // odd row below it.
        e.move_down();
      } else {
        // The middle of the row below an odd row is the sum of its two
        // equal middles.
        e = Entry<V>(n + 1, e.row_position() + 1,
                     checked_add(e.value(), e.value()));
      }
    }
  }

  // The values are taken as given and not checked.
  explicit Centre(std::vector<V> data) : data_(std::move(data)) {
    if (data_.empty()) {
      throw std::invalid_argument("Centre requires at least row 0");
    }
  }

  int size() const { return static_cast<int>(data_.size()); }
  ZeroRange indices() const { return ZeroRange(size() - 1); }
  int first_index() const { return 0; }
  int last_index() const { return size() - 1; }
  const std::vector<V> &values() const { return data_; }

  const V &operator[](int i) const {
    if (i < 0 || i >= size()) {
      throw std::out_of_range(
          std::format("index {} out of range 0:{}", i, last_index()));
    }
    return data_[i];
  }

  // With left_bias the entries of odd rows are placed at k = n/2,
  // otherwise at k = n/2 + 1.
  std::vector<Entry<V>> to_array(bool left_bias = true) const {
    std::vector<Entry<V>> result;
    result.reserve(data_.size());
    for (int n = 0; n < size(); ++n) {
      result.emplace_back(n, left_bias ? n / 2 : (n + 1) / 2, data_[n]);
    }
    return result;
  }

  // Compares the values against exact binomial coefficients. This is slow.
  bool is_valid() const {
    for (int n = 0; n < size(); ++n) {
      if (!is_exact_binomial(data_[n], n, n / 2)) {
        return false;
      }
    }
    return true;
  }

 private:
  std::vector<V> data_;
};

// The central elements of Pascal's triangle, calculated only as they are
// requested. Rows 0 and 1 are always present. The cache only grows.
template <typename V = BigInt>
class LazyCentre {
 public:
  using value_type = V;

  LazyCentre() : data_{{0, V(1)}, {1, V(1)}} {}

  // The values are taken as given and not checked.
  explicit LazyCentre(std::map<int, V> data) : data_(std::move(data)) {
    if (!data_.empty() && data_.begin()->first < 0) {
      throw std::invalid_argument("LazyCentre rows must be nonnegative");
    }
  }

  explicit LazyCentre(const Centre<V> &centre) {
    for (int n = 0; n < centre.size(); ++n) {
      data_.emplace(n, centre[n]);
    }
  }

  int first_index() const { return 0; }
  const std::map<int, V> &cached() const { return data_; }
  bool is_cached(int i) const { return data_.contains(i); }

  // C(i, i/2). A value not yet cached is calculated directly and then the
  // rows either side are filled in by moving up and down.
  V operator[](int i) {
    if (i < 0) {
      throw std::out_of_range(std::format("index {} out of range", i));
    }
    const auto found = data_.find(i);
    if (found != data_.end()) {
      return found->second;
    }

    // An odd row has two middles with the same value. Going up the walk
    // arrives at the right one and going down it must leave from the
    // right one, so the position is relabelled on every odd row.
    const Entry<V> entry(i, i / 2);
    Entry<V> a = entry;
    for (int j = i - 1; j >= std::max(2, i - precalc_number); --j) {
      a.move_up();
      if (a.row_number() % 2 == 1) {
        a = Entry<V>(a.row_number(), a.row_position() - 1, a.value());
      }
      data_.try_emplace(j, a.value());
    }
    a = entry;
    if (i % 2 == 1) {
      a = Entry<V>(i, i / 2 + 1, entry.value());
    }
    try {
      for (int j = i + 1; j <= i + precalc_number; ++j) {
        a.move_down();
        if (a.row_number() % 2 == 1) {
          a = Entry<V>(a.row_number(), a.row_position() + 1, a.value());
        }
        data_.try_emplace(j, a.value());
      }
    } catch (const std::overflow_error &) {
      // Rows further down do not fit in V; they are left uncached.
    }
    data_.emplace(i, entry.value());
    return entry.value();
  }

  // The cached values only, in row order.
  std::vector<Entry<V>> to_array(bool left_bias = true) const {
    std::vector<Entry<V>> result;
    result.reserve(data_.size());
    for (const auto &[n, value] : data_) {
      result.emplace_back(n, left_bias ? n / 2 : (n + 1) / 2, value);
    }
    return result;
  }

  bool is_valid() const {
    return std::all_of(data_.begin(), data_.end(), [](const auto &p) {
      return is_exact_binomial(p.second, p.first, p.first / 2);
    });
  }

 private:
  std::map<int, V> data_;
};

// The leading rows of a lazy centre that have been calculated without
// gaps.
template <typename V>
Centre<V> to_centre(const LazyCentre<V> &centre) {
  std::vector<V> data;
  const auto &cached = centre.cached();
  for (int n = 0;; ++n) {
    const auto found = cached.find(n);
    if (found == cached.end()) {
      break;
    }
    data.push_back(found->second);
  }
  return Centre<V>(std::move(data));
}

template <typename V, typename U>
bool operator==(const Centre<V> &a, const Centre<U> &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (int i = 0; i < a.size(); ++i) {
    if (!numerically_equal(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

template <typename V, typename U>
bool operator==(const LazyCentre<V> &a, const LazyCentre<U> &b) {
  if (a.cached().size() != b.cached().size()) {
    return false;
  }
  auto it = b.cached().begin();
  for (const auto &[n, value] : a.cached()) {
    if (n != it->first || !numerically_equal(value, it->second)) {
      return false;
    }
    ++it;
  }
  return true;
}

template <typename V>
std::ostream &operator<<(std::ostream &os, const Centre<V> &c) {
  os << "Centre[";
  for (int i = 0; i < c.size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << c[i];
  }
  return os << "]";
}

template <typename V>
std::ostream &operator<<(std::ostream &os, const LazyCentre<V> &c) {
  os << "LazyCentre{";
  bool first = true;
  for (const auto &[n, value] : c.cached()) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << n << " => " << value;
  }
  return os << "}";
}

}  // namespace pascal
