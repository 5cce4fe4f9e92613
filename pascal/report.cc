#include "report.h"

#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

#include "centre.h"
#include "collisions.h"
#include "column.h"
#include "entry.h"
#include "errors.h"
#include "movement.h"
#include "numeric.h"
#include "row.h"

namespace pascal {

namespace {

// Shows a neighbour of an entry, or why there isn't one.
template <typename V>
void neighbour(std::ostream &out, const std::string &name,
               const std::function<Entry<V>()> &move) {
  out << std::format("  {:<6}", name);
  try {
    out << move() << "\n";
  } catch (const OutOfBoundsError &e) {
    out << e.reason() << "\n";
  }
}

template <typename V>
void report_entry(int n, int k, std::ostream &out) {
  const Entry<V> e(n, k);
  out << "entry " << e << "\n";
  neighbour<V>(out, "up", [&e]() { return up(e); });
  neighbour<V>(out, "down", [&e]() { return down(e); });
  neighbour<V>(out, "left", [&e]() { return left(e); });
  neighbour<V>(out, "right", [&e]() { return right(e); });
  neighbour<V>(out, "prev", [&e]() { return prev(e); });
  neighbour<V>(out, "next", [&e]() { return next(e); });
}

template <typename V>
void report_row(int n, std::ostream &out) {
  const Row<V> row(n);
  out << "row " << n << ": " << row << "\n";
  out << "sum: " << row.sum() << "\n";
}

template <typename V>
void report_column(int colnum, int size, std::ostream &out) {
  out << Column<V>(colnum, size) << "\n";
}

template <typename V>
void report_centre(int maxrow, std::ostream &out) {
  out << Centre<V>(maxrow) << "\n";
}

void report_collisions(int max_row, std::ostream &out) {
  const auto collisions = find_collisions(max_row);
  for (const Collision &c : collisions) {
    out << c << "\n";
  }
  out << std::format("{} collisions up to row {}\n", collisions.size(),
                     max_row);
}

template <typename V>
void report_as(const Command &command, std::ostream &out) {
  const auto &args = command.args;
  switch (command.verb) {
    case Verb::entry:
      report_entry<V>(args[0], args[1], out);
      break;
    case Verb::row:
      report_row<V>(args[0], out);
      break;
    case Verb::column:
      report_column<V>(args[0], args[1], out);
      break;
    case Verb::centre:
      report_centre<V>(args[0], out);
      break;
    case Verb::collisions:
      report_collisions(args[0], out);
      break;
  }
}

}  // namespace

void report(const Command &command, std::ostream &out) {
  switch (command.kind) {
    case ValueKind::floating:
      report_as<double>(command, out);
      break;
    case ValueKind::big:
      report_as<BigInt>(command, out);
      break;
    case ValueKind::integer:
      report_as<std::int64_t>(command, out);
      break;
    case ValueKind::unspecified:
      // Central elements overflow 64 bits quickly.
      if (command.verb == Verb::centre) {
        report_as<BigInt>(command, out);
      } else {
        report_as<std::int64_t>(command, out);
      }
      break;
  }
}

}  // namespace pascal
