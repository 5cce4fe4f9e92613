#pragma once

#include <ostream>
#include <vector>

#include "entry.h"

namespace pascal {

// Two different places in the left half of Pascal's triangle holding the
// same value. later is in the same or a later row than earlier.
struct Collision {
  Entry<double> later;
  Entry<double> earlier;

  friend bool operator==(const Collision &lhs, const Collision &rhs) {
    return lhs.later == rhs.later && lhs.earlier == rhs.earlier;
  }
};

// Finds every value that occurs more than once among the entries (n,k)
// with 2 <= k <= n/2 and n <= max_row, in increasing order of value.
// A value occurring m times gives m-1 collisions.
//
// Values are visited in increasing order using a heap holding one entry
// per row, so equal values are popped one after the other. They are
// compared in floating point and every candidate is then confirmed
// exactly. Rows beyond about 1000 overflow a double.
std::vector<Collision> find_collisions(int max_row);

std::ostream &operator<<(std::ostream &os, const Collision &c);

}  // namespace pascal
