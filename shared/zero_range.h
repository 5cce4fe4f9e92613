#pragma once

#include <cstddef>
#include <iterator>
#include <ostream>

namespace pascal {

// The integer interval [0, max], used as the index domain of rows and
// sequences of central elements.
class ZeroRange {
 public:
  class iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = int;
    using difference_type = std::ptrdiff_t;
    using pointer = const int *;
    using reference = int;

    iterator() : i_(0) {}
    explicit iterator(int i) : i_(i) {}

    int operator*() const { return i_; }
    iterator &operator++() {
      ++i_;
      return *this;
    }
    iterator operator++(int) {
      iterator old = *this;
      ++i_;
      return old;
    }
    friend bool operator==(const iterator &lhs, const iterator &rhs) {
      return lhs.i_ == rhs.i_;
    }

   private:
    int i_;
  };

  explicit ZeroRange(int max);

  int size() const { return max_ + 1; }
  int front() const { return 0; }
  int back() const { return max_; }
  bool contains(int i) const { return 0 <= i && i <= max_; }

  // The i-th element of the range, which is simply i.
  int operator[](int i) const;

  iterator begin() const { return iterator(0); }
  iterator end() const { return iterator(max_ + 1); }

  friend bool operator==(const ZeroRange &lhs, const ZeroRange &rhs) {
    return lhs.max_ == rhs.max_;
  }

 private:
  int max_;
};

std::ostream &operator<<(std::ostream &os, const ZeroRange &range);

}  // namespace pascal
