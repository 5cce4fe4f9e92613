#pragma once

#include <stdexcept>
#include <string>

namespace pascal {

// Raised when a movement would leave Pascal's triangle, e.g. moving above
// the top entry or to the left of column zero.
class OutOfBoundsError : public std::runtime_error {
 public:
  explicit OutOfBoundsError(const std::string &reason)
      : std::runtime_error("OutOfBoundsError: " + reason), reason_(reason) {}

  const std::string &reason() const { return reason_; }

 private:
  std::string reason_;
};

// Raised when entries are added or subtracted that are not arranged
// appropriately. Adjacent entries on one row can be added; an entry and
// one directly above (or above and to the right) can be subtracted.
class NonAdjacentError : public std::runtime_error {
 public:
  NonAdjacentError()
      : std::runtime_error(
            "NonAdjacentError: entries not appropriately arranged") {}
};

}  // namespace pascal
