#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <ostream>
#include <stdexcept>

#include "binomial.h"
#include "errors.h"
#include "numeric.h"

namespace pascal {

// A single entry of Pascal's triangle: row n, position k within the row
// (0 <= k <= n) and the value C(n,k).
//
// The movement members compute the value of a neighbouring entry from this
// one with a single multiply and divide, which is much cheaper than
// computing a binomial coefficient from scratch. They are the canonical
// movement operations; the free functions in movement.h copy and then move.
template <typename V = std::int64_t>
class Entry {
 public:
  using value_type = V;

  // The entry at the top of the triangle.
  Entry() : n_(0), k_(0), value_(1) {}

  // The value is calculated directly.
  Entry(int n, int k)
      : n_(n), k_(k), value_((check(n, k), binomial<V>(n, k))) {}

  // The value is not checked for correctness, which avoids the cost of
  // calculating it when it is already known.
  Entry(int n, int k, const V &value) : n_(n), k_(k), value_(value) {
    check(n, k);
  }

  int row_number() const { return n_; }
  int row_position() const { return k_; }
  const V &value() const { return value_; }

  bool is_first() const { return n_ == 0 && k_ == 0; }
  bool is_at_left() const { return k_ <= 0; }
  bool is_at_right() const { return k_ >= n_; }

  // Not on either edge, so the value isn't 1.
  bool is_interior() const { return n_ >= 2 && k_ >= 1 && k_ < n_; }

  // Whether the value really is C(n,k). This is slow.
  bool is_valid() const {
    return 0 <= k_ && k_ <= n_ && is_exact_binomial(value_, n_, k_);
  }

  // (n-1, k)
  Entry &move_up() {
    if (is_at_right() || is_first()) {
      throw OutOfBoundsError("no entry above");
    }
    value_ = mul_div(value_, n_ - k_, n_);
    n_ -= 1;
    return *this;
  }

  // (n+1, k)
  Entry &move_down() {
    value_ = mul_div(value_, n_ + 1, n_ - k_ + 1);
    n_ += 1;
    return *this;
  }

  // (n, k-1)
  Entry &move_left() {
    if (is_at_left()) {
      throw OutOfBoundsError("no entry to the left");
    }
    step_left();
    return *this;
  }

  // (n, k+1)
  Entry &move_right() {
    if (is_at_right()) {
      throw OutOfBoundsError("no entry to the right");
    }
    step_right();
    return *this;
  }

  // The previous entry reading the triangle row by row, left to right.
  Entry &retreat() {
    if (is_first()) {
      throw OutOfBoundsError("no previous entry");
    }
    if (!is_at_left()) {
      step_left();
    } else {
      n_ -= 1;
      k_ = n_;
      value_ = 1;
    }
    return *this;
  }

  // The next entry reading the triangle row by row, left to right.
  Entry &advance() {
    if (!is_at_right()) {
      step_right();
    } else {
      n_ += 1;
      k_ = 0;
      value_ = 1;
    }
    return *this;
  }

 private:
  static void check(int n, int k) {
    if (n < 0 || k < 0 || k > n) {
      throw std::invalid_argument(
          std::format("Entry requires 0 <= k <= n but n:{}, k:{}", n, k));
    }
  }

  // The division comes last so that integer value types stay exact. The
  // value is replaced before the position so that an overflow leaves the
  // entry unchanged.
  void step_left() {
    value_ = mul_div(value_, k_, n_ - k_ + 1);
    k_ -= 1;
  }

  void step_right() {
    value_ = mul_div(value_, n_ - k_, k_ + 1);
    k_ += 1;
  }

  int n_;
  int k_;
  V value_;
};

template <typename V, typename U>
bool is_adjacent(const Entry<V> &a, const Entry<U> &b) {
  return a.row_number() == b.row_number() &&
         std::abs(a.row_position() - b.row_position()) == 1;
}

// a lies in the row beneath b, either directly beneath or one place to the
// right, and is not on an edge.
template <typename V, typename U>
bool is_subtractable(const Entry<V> &a, const Entry<U> &b) {
  const int dk = a.row_position() - b.row_position();
  return a.row_number() == b.row_number() + 1 && a.is_interior() && 0 <= dk &&
         dk <= 1;
}

// Two entries are equal if they are at the same place in the triangle and
// have the same value, although their value types may differ.
template <typename V, typename U>
bool operator==(const Entry<V> &a, const Entry<U> &b) {
  return a.row_number() == b.row_number() &&
         a.row_position() == b.row_position() &&
         numerically_equal(a.value(), b.value());
}

template <typename V, typename U>
bool approx_equal(const Entry<V> &a, const Entry<U> &b) {
  return a.row_number() == b.row_number() &&
         a.row_position() == b.row_position() &&
         approx_equal(a.value(), b.value());
}

// Entries are ordered only by their value, ignoring where they are.
template <typename V, typename U>
bool operator<(const Entry<V> &a, const Entry<U> &b) {
  return a.value() < b.value();
}

template <typename V, typename U>
bool operator>(const Entry<V> &a, const Entry<U> &b) {
  return b < a;
}

template <typename V, typename U>
bool operator<=(const Entry<V> &a, const Entry<U> &b) {
  return !(b < a);
}

template <typename V, typename U>
bool operator>=(const Entry<V> &a, const Entry<U> &b) {
  return !(a < b);
}

// Adding adjacent entries gives the entry directly beneath the two.
template <typename V>
Entry<V> operator+(const Entry<V> &a, const Entry<V> &b) {
  if (!is_adjacent(a, b)) {
    throw NonAdjacentError();
  }
  return Entry<V>(a.row_number() + 1,
                  std::max(a.row_position(), b.row_position()),
                  checked_add(a.value(), b.value()));
}

// The inverse of addition: the entry beneath minus one of the two above it
// gives the other.
template <typename V>
Entry<V> operator-(const Entry<V> &a, const Entry<V> &b) {
  if (!is_subtractable(a, b)) {
    throw NonAdjacentError();
  }
  return Entry<V>(b.row_number(),
                  2 * a.row_position() - b.row_position() - 1,
                  a.value() - b.value());
}

template <typename V>
std::ostream &operator<<(std::ostream &os, const Entry<V> &e) {
  return os << "(" << e.row_number() << ", " << e.row_position() << ", "
            << e.value() << ")";
}

}  // namespace pascal
