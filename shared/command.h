#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pascal {

enum class Verb { entry, row, column, centre, collisions };

// The value type the command computes with.
enum class ValueKind { integer, floating, big, unspecified };

struct Command {
  Verb verb;
  std::vector<int> args;
  ValueKind kind;

  friend bool operator==(const Command &lhs, const Command &rhs) = default;
};

// Parses a command line of one of the forms
//
//   entry N K
//   row N
//   column C LEN
//   centre MAXROW        (or center)
//   collisions MAXROW
//
// where all but collisions may be followed by --int, --float or --big.
// All numbers are nonnegative integers. Returns nullopt for anything else.
std::optional<Command> parse_command(const std::string &line);

}  // namespace pascal
