#include "zero_range.h"

#include <format>
#include <stdexcept>

namespace pascal {

ZeroRange::ZeroRange(int max) : max_(max) {
  if (max < 0) {
    throw std::invalid_argument("end of range must be nonnegative");
  }
}

int ZeroRange::operator[](int i) const {
  if (!contains(i)) {
    throw std::out_of_range(
        std::format("index {} out of range 0:{}", i, max_));
  }
  return i;
}

std::ostream &operator<<(std::ostream &os, const ZeroRange &range) {
  return os << "ZeroRange(" << range.back() << ")";
}

}  // namespace pascal
