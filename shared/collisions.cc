#include "collisions.h"

#include <functional>
#include <queue>
#include <stdexcept>
#include <vector>

#include "binomial.h"
#include "column.h"
#include "numeric.h"

namespace pascal {

std::vector<Collision> find_collisions(int max_row) {
  if (max_row < 0) {
    throw std::invalid_argument("max_row must be nonnegative");
  }
  std::vector<Collision> result;
  if (max_row < 4) {
    // There are no entries with 2 <= k <= n/2.
    return result;
  }

  // Start every row at position 2, reading the values down column 2.
  std::priority_queue<Entry<double>, std::vector<Entry<double>>,
                      std::greater<>>
      queue;
  for (const Entry<double> &e : Column<double>(2, max_row - 1).to_array()) {
    if (e.row_number() >= 4) {
      queue.push(e);
    }
  }

  while (!queue.empty()) {
    Entry<double> e = queue.top();
    queue.pop();
    if (!queue.empty() && approx_equal(e.value(), queue.top().value())) {
      const Entry<double> &top = queue.top();
      if (exact_binomial(e.row_number(), e.row_position()) ==
          exact_binomial(top.row_number(), top.row_position())) {
        if (e.row_number() > top.row_number()) {
          result.push_back({e, top});
        } else {
          result.push_back({top, e});
        }
      }
    }
    // Move along the row until the middle.
    if (2 * (e.row_position() + 1) <= e.row_number()) {
      e.move_right();
      queue.push(e);
    }
  }
  return result;
}

std::ostream &operator<<(std::ostream &os, const Collision &c) {
  return os << c.later << " == " << c.earlier;
}

}  // namespace pascal
