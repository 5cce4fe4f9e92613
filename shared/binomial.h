#pragma once

#include <cmath>
#include <stdexcept>
#include <type_traits>

#include "numeric.h"

namespace pascal {

// Given n things, how many ways are there of choosing k of them?
// Computed directly in the value type V. Each partial result is itself a
// binomial coefficient, so multiplying before dividing keeps integer types
// exact. An integer type throws std::overflow_error if C(n,k) does not fit.
template <typename V>
V binomial(int n, int k) {
  if (n < 0 || k < 0) {
    throw std::invalid_argument("binomial not defined for negatives");
  }
  if (k > n) {
    return V(0);
  }

  {
    int other = n - k;
    if (other < k) {
      k = other;
    }
  }

  if (k == 0) {
    return V(1);
  }

  V result(n);
  for (int j = 2; j <= k; ++j) {
    result = mul_div(result, n + 1 - j, j);
  }
  return result;
}

// Moving to a neighbouring entry is much faster than calculating an isolated
// binomial coefficient, so when a lazy container misses its cache it also
// fills in this many values either side of the one requested.
inline constexpr int precalc_number = 5;

// The binomial coefficient with no possibility of overflow. This is what
// the validity checks compare against.
BigInt exact_binomial(int n, int k);

// Whether value is exactly C(n,k). Floating values must be integral.
template <typename V>
bool is_exact_binomial(const V &value, int n, int k) {
  if constexpr (std::is_floating_point_v<V>) {
    if (!std::isfinite(value) || std::trunc(value) != value) {
      return false;
    }
    return BigInt(value) == exact_binomial(n, k);
  } else {
    return BigInt(value) == exact_binomial(n, k);
  }
}

}  // namespace pascal
