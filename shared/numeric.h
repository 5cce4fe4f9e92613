#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cmath>
#include <format>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace pascal {

// Arbitrary precision integer. Used as a value type in its own right and
// for checking other value types without overflow.
using BigInt = boost::multiprecision::cpp_int;

// Values of different numeric types compare equal when they represent the
// same number. An arbitrary precision value is converted to the floating
// type rather than the other way round.
template <typename A, typename B>
bool numerically_equal(const A &a, const B &b) {
  if constexpr (std::is_floating_point_v<A> && !std::is_arithmetic_v<B>) {
    return a == static_cast<A>(b);
  } else if constexpr (std::is_floating_point_v<B> &&
                       !std::is_arithmetic_v<A>) {
    return static_cast<B>(a) == b;
  } else {
    return a == b;
  }
}

// Exact for two integer types, otherwise a relative tolerance of
// sqrt(epsilon) of the larger magnitude.
template <typename A, typename B>
bool approx_equal(const A &a, const B &b) {
  if constexpr (!std::is_floating_point_v<A> && !std::is_floating_point_v<B>) {
    return a == b;
  } else {
    const long double x = static_cast<long double>(a);
    const long double y = static_cast<long double>(b);
    if (x == y) {
      return true;
    }
    static const long double tolerance = std::sqrt(
        static_cast<long double>(std::numeric_limits<double>::epsilon()));
    return std::fabs(x - y) <=
           tolerance * std::fmax(std::fabs(x), std::fabs(y));
  }
}

// a + b, throwing rather than wrapping when an integer type overflows.
template <typename V>
V checked_add(const V &a, const V &b) {
  if constexpr (std::is_integral_v<V>) {
    V result;
    if (__builtin_add_overflow(a, b, &result)) {
      throw std::overflow_error("value would cause integer overflow");
    }
    return result;
  } else {
    return a + b;
  }
}

// value * num / den, for a quotient that is known to be a whole number.
//
// For integer types the common factor of value and den is cancelled first,
// so the product only overflows when the quotient itself does not fit, and
// then std::overflow_error is thrown.
template <typename V>
V mul_div(const V &value, int num, int den) {
  if constexpr (std::is_integral_v<V>) {
    const V g = std::gcd(value, static_cast<V>(den));
    V a = value;
    V b = num;
    V d = den;
    if (g != 0 && num % (den / g) == 0) {
      a = value / g;
      b = num / (den / g);
      d = 1;
    }
    V product;
    if (__builtin_mul_overflow(a, b, &product)) {
      throw std::overflow_error("value would cause integer overflow");
    }
    return product / d;
  } else {
    return value * num / den;
  }
}

// 2**n in the value type V.
template <typename V>
V power_of_two(int n) {
  if constexpr (std::is_floating_point_v<V>) {
    return std::ldexp(V(1), n);
  } else if constexpr (std::is_integral_v<V>) {
    if (n >= std::numeric_limits<V>::digits) {
      throw std::overflow_error(
          std::format("2**n would cause integer overflow, n: {}", n));
    }
    return V(1) << n;
  } else {
    return V(1) << n;
  }
}

}  // namespace pascal
