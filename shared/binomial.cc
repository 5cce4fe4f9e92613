#include "binomial.h"

#include <array>
#include <stdexcept>

namespace pascal {

namespace {

// For all the small values we expect to see most often, cache them in a
// table. Row m is stored at offset m*(m+1)/2.
constexpr int table_rows = 32;

const std::array<BigInt, table_rows *(table_rows + 1) / 2> &small_table() {
  static const auto table = []() {
    std::array<BigInt, table_rows *(table_rows + 1) / 2> t;
    int i = 0;
    for (int n = 0; n < table_rows; ++n) {
      t[i] = 1;
      for (int k = 1; k <= n; ++k) {
        // Pascal's rule against the row above.
        const int above = i - n;
        t[i + k] = (k < n ? t[above + k] : BigInt(0)) + t[above + k - 1];
      }
      i += n + 1;
    }
    return t;
  }();
  return table;
}

}  // namespace

BigInt exact_binomial(int n, int k) {
  if (n < 0 || k < 0) {
    throw std::invalid_argument("binomial not defined for negatives");
  }
  if (k > n) {
    return 0;
  }
  if (n < table_rows) {
    return small_table()[n * (n + 1) / 2 + k];
  }
  return binomial<BigInt>(n, k);
}

}  // namespace pascal
