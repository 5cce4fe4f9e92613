#pragma once

// Movement around Pascal's triangle that returns a new object and leaves
// its argument alone. Each function copies and then applies the matching
// in-place member (move_up, advance, ...), which is where the arithmetic
// lives.
//
// Rows move up and down; columns move left and right.

#include <utility>

#include "column.h"
#include "entry.h"
#include "lazy_column.h"
#include "row.h"

namespace pascal {

template <typename V>
Entry<V> up(Entry<V> e) {
  return e.move_up();
}

template <typename V>
Entry<V> down(Entry<V> e) {
  return e.move_down();
}

template <typename V>
Entry<V> left(Entry<V> e) {
  return e.move_left();
}

template <typename V>
Entry<V> right(Entry<V> e) {
  return e.move_right();
}

template <typename V>
Entry<V> prev(Entry<V> e) {
  return e.retreat();
}

template <typename V>
Entry<V> next(Entry<V> e) {
  return e.advance();
}

template <typename V>
Row<V> prev(Row<V> r) {
  return std::move(r.retreat());
}

template <typename V>
Row<V> next(Row<V> r) {
  return std::move(r.advance());
}

template <typename V>
Row<V> up(Row<V> r) {
  return prev(std::move(r));
}

template <typename V>
Row<V> down(Row<V> r) {
  return next(std::move(r));
}

template <typename V>
Column<V> prev(Column<V> c) {
  return std::move(c.retreat());
}

template <typename V>
Column<V> next(Column<V> c) {
  return std::move(c.advance());
}

template <typename V>
Column<V> left(Column<V> c) {
  return prev(std::move(c));
}

template <typename V>
Column<V> right(Column<V> c) {
  return next(std::move(c));
}

template <typename V>
LazyColumn<V> prev(LazyColumn<V> c) {
  return std::move(c.retreat());
}

template <typename V>
LazyColumn<V> next(LazyColumn<V> c) {
  return std::move(c.advance());
}

template <typename V>
LazyColumn<V> left(LazyColumn<V> c) {
  return prev(std::move(c));
}

template <typename V>
LazyColumn<V> right(LazyColumn<V> c) {
  return next(std::move(c));
}

}  // namespace pascal
