#include <cstdint>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "binomial.h"
#include "column.h"
#include "entry.h"
#include "errors.h"
#include "gtest/gtest.h"
#include "lazy_column.h"
#include "movement.h"
#include "numeric.h"

namespace pascal {
namespace {

using Values = std::vector<std::int64_t>;

TEST(Column, Constructors) {
  EXPECT_THROW(Column<>(-1, Values{}), std::domain_error);
  EXPECT_THROW(Column<>(-1, 3), std::domain_error);
  EXPECT_THROW(Column<>(2, -1), std::domain_error);

  {
    const Column<> a(0, Values{1, 1, 1, 1});
    Column<> b(a);
    const Column<> c(0, 4);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    b.advance();
    EXPECT_NE(a, b);
  }
  {
    const Column<double> a(3, std::vector<double>{1.0, 4.0, 10.0, 20.0});
    const Column<double> b(a);
    const Column<double> c(3, 4);
    const Column<> d(3, 4);  // different value type
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a, d);
  }
  EXPECT_EQ(Column<>(5, 0).size(), 0);
}

TEST(Column, Accessors) {
  const Column<> a(5, 4);
  EXPECT_EQ(a.column_number(), 5);
  EXPECT_EQ(a.values(), (Values{1, 6, 21, 56}));
  EXPECT_EQ(Column<>(4, 5).values(), (Values{1, 5, 15, 35, 70}));
}

TEST(Column, ArrayFunctions) {
  const Column<> a(7, 8);
  const Column<double> b(7, 8);
  EXPECT_EQ(a.size(), 8);
  EXPECT_EQ(b.size(), 8);

  for (int i = 7; i <= 14; ++i) {
    EXPECT_EQ(a[i], b[i]) << i;
  }

  EXPECT_THROW(a[6], std::out_of_range);
  EXPECT_THROW(a[15], std::out_of_range);

  EXPECT_EQ(a.first_index(), 7);
  EXPECT_EQ(b.first_index(), 7);
  EXPECT_EQ(a.last_index(), 14);
  EXPECT_EQ(b.last_index(), 14);
}

TEST(Column, AllValues) {
  for (int colnum = 0; colnum <= 12; ++colnum) {
    const Column<> column(colnum, 30);
    for (int i = colnum; i < colnum + 30; ++i) {
      EXPECT_EQ(BigInt(column[i]), exact_binomial(i, colnum))
          << i << " " << colnum;
    }
  }
}

TEST(Column, Checks) {
  const Column<> a(0, 5);
  const Column<> b(4, 5);
  const Column<> c(4, Values{1, 5, 15, 35, 80});
  const Column<double> d(4, std::vector<double>{1.0, 5.0, 15.0, 35.0, 70.0});

  EXPECT_TRUE(a.is_first());
  EXPECT_TRUE(a.is_at_left());
  EXPECT_FALSE(b.is_first());

  EXPECT_TRUE(a.is_valid());
  EXPECT_TRUE(b.is_valid());
  EXPECT_FALSE(c.is_valid());

  const auto x = b.to_array();
  const auto y = d.to_array();
  ASSERT_EQ(x.size(), y.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    EXPECT_EQ(x[i], y[i]);
  }
  EXPECT_EQ(x.back(), Entry<>(8, 4, 70));
}

TEST(Column, Movement) {
  Column<> a(0, 4);
  Column<> b(8, 4);
  const Column<> c(9, 4);
  Column<> d(10, 4);

  EXPECT_THROW(a.retreat(), OutOfBoundsError);
  EXPECT_THROW(left(a), OutOfBoundsError);
  EXPECT_THROW(prev(a), OutOfBoundsError);
  EXPECT_EQ(a, Column<>(0, 4));

  EXPECT_EQ(left(c), b);
  EXPECT_EQ(prev(c), b);
  EXPECT_EQ(right(c), d);
  EXPECT_EQ(next(c), d);

  Column<> e(b);
  Column<> f(d);

  b.advance();
  e.advance();
  d.retreat();
  f.retreat();
  EXPECT_EQ(b, c);
  EXPECT_EQ(d, c);
  EXPECT_EQ(e, c);
  EXPECT_EQ(f, c);
}

TEST(Column, AdvanceAcross) {
  Column<> column(0, 12);
  for (int colnum = 1; colnum <= 20; ++colnum) {
    column.advance();
    EXPECT_EQ(column, Column<>(colnum, 12)) << colnum;
  }
  for (int colnum = 19; colnum >= 0; --colnum) {
    column.retreat();
    EXPECT_EQ(column, Column<>(colnum, 12)) << colnum;
  }
}

TEST(Column, LargestIntegerValues) {
  EXPECT_TRUE(Column<>(30, 37).is_valid());
  EXPECT_THROW(Column<>(30, 38), std::overflow_error);

  // C(67,30) does not fit, so the advance fails and changes nothing.
  Column<> column(29, 38);
  EXPECT_THROW(column.advance(), std::overflow_error);
  EXPECT_EQ(column, Column<>(29, 38));
  EXPECT_TRUE(column.is_valid());
}

TEST(Column, Print) {
  std::ostringstream os;
  os << Column<>(2, 3);
  EXPECT_EQ(os.str(), "Column(2)[1, 3, 6]");
}

TEST(LazyColumn, Constructors) {
  EXPECT_THROW(LazyColumn<>(-1, {}), std::domain_error);
  EXPECT_THROW(LazyColumn<>(-1), std::domain_error);
  EXPECT_THROW(LazyColumn<>(2, {{0, 1}}), std::invalid_argument);

  {
    const LazyColumn<> a(0, {{1, 1}});
    LazyColumn<> b(a);
    const LazyColumn<> c(0);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    b[4];
    EXPECT_NE(a, b);
  }
  {
    const LazyColumn<double> a(3, {{1, 1.0}});
    const LazyColumn<double> b(a);
    const LazyColumn<double> c(3);
    const LazyColumn<> d(3);  // different value type
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a, d);
  }
}

TEST(LazyColumn, Accessors) {
  const LazyColumn<> a(5);
  EXPECT_EQ(a.column_number(), 5);
  EXPECT_EQ(a.first_index(), 5);
  EXPECT_EQ(a.cached().size(), 1u);
}

TEST(LazyColumn, ArrayFunctions) {
  LazyColumn<> a(7);
  LazyColumn<double> b(7);
  for (int i = 7; i <= 14; ++i) {
    EXPECT_EQ(a[i], b[i]) << i;
  }
  EXPECT_THROW(a[-1], std::out_of_range);
  EXPECT_THROW(a[6], std::out_of_range);
  EXPECT_EQ(a.first_index(), 7);
  EXPECT_EQ(b.first_index(), 7);
}

TEST(LazyColumn, FillsNeighbours) {
  LazyColumn<> a(3);
  EXPECT_EQ(a[20], binomial<std::int64_t>(20, 3));
  // Offset 18, with five either side.
  for (int i = 15; i <= 25; ++i) {
    EXPECT_TRUE(a.is_cached(i)) << i;
  }
  EXPECT_TRUE(a.is_cached(3));
  EXPECT_FALSE(a.is_cached(14));
  EXPECT_FALSE(a.is_cached(26));
  EXPECT_TRUE(a.is_valid());

  // Near the top the walk up stops at the first row of the column.
  LazyColumn<> b(6);
  EXPECT_EQ(b[8], 28);
  for (int i = 6; i <= 13; ++i) {
    EXPECT_TRUE(b.is_cached(i)) << i;
  }
  EXPECT_EQ(b.cached().size(), 8u);
  EXPECT_TRUE(b.is_valid());
}

TEST(LazyColumn, AgreesWithColumn) {
  for (int colnum = 0; colnum <= 10; ++colnum) {
    const Column<> eager(colnum, 25);
    LazyColumn<> lazy(colnum);
    for (int i = colnum + 24; i >= colnum; i -= 3) {
      lazy[i];
    }
    for (int i = colnum; i < colnum + 25; ++i) {
      EXPECT_EQ(lazy[i], eager[i]);
    }
    const auto x = eager.to_array();
    const auto y = lazy.to_array();
    ASSERT_GE(y.size(), x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
      EXPECT_EQ(x[i], y[i]);
    }
    EXPECT_GE(to_column(lazy).size(), 25);
  }
}

TEST(LazyColumn, Conversions) {
  const Column<> eager(4, 6);
  const LazyColumn<> lazy(eager);
  EXPECT_EQ(lazy, LazyColumn<>(4, {{1, 1}, {2, 5}, {3, 15}, {4, 35},
                                   {5, 70}, {6, 126}}));
  EXPECT_EQ(to_column(lazy), eager);

  // Only the leading values without gaps.
  const LazyColumn<> gappy(4, {{1, 1}, {2, 5}, {4, 35}});
  EXPECT_EQ(to_column(gappy), Column<>(4, 2));
}

TEST(LazyColumn, Checks) {
  const LazyColumn<> a(0);
  const LazyColumn<> b(4, {{1, 1}, {2, 5}, {3, 15}, {4, 35}, {5, 70}});
  const LazyColumn<> c(4, {{1, 1}, {2, 5}, {3, 15}, {4, 35}, {5, 80}});
  const LazyColumn<double> d(
      4, {{1, 1.0}, {2, 5.0}, {3, 15.0}, {4, 35.0}, {5, 70.0}});

  EXPECT_TRUE(a.is_first());
  EXPECT_TRUE(a.is_at_left());
  EXPECT_FALSE(b.is_first());

  EXPECT_TRUE(a.is_valid());
  EXPECT_TRUE(b.is_valid());
  EXPECT_FALSE(c.is_valid());

  const auto x = b.to_array();
  const auto y = d.to_array();
  ASSERT_EQ(x.size(), y.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    EXPECT_EQ(x[i], y[i]);
  }
}

TEST(LazyColumn, Movement) {
  LazyColumn<> a(0);
  LazyColumn<> b(8);
  const LazyColumn<> c(9);
  LazyColumn<> d(10);

  EXPECT_THROW(a.retreat(), OutOfBoundsError);
  EXPECT_THROW(left(a), OutOfBoundsError);
  EXPECT_THROW(prev(a), OutOfBoundsError);

  EXPECT_EQ(left(c), b);
  EXPECT_EQ(prev(c), b);
  EXPECT_EQ(right(c), d);
  EXPECT_EQ(next(c), d);

  LazyColumn<> e(b);
  LazyColumn<> f(d);

  b.advance();
  e.advance();
  d.retreat();
  f.retreat();
  EXPECT_EQ(b, c);
  EXPECT_EQ(d, c);
  EXPECT_EQ(e, c);
  EXPECT_EQ(f, c);
}

TEST(LazyColumn, MovementKeepsCache) {
  LazyColumn<> column(3);
  column[12];
  const auto offsets = column.cached().size();

  column.advance();
  EXPECT_EQ(column.column_number(), 4);
  EXPECT_EQ(column.cached().size(), offsets);
  EXPECT_TRUE(column.is_valid());
  EXPECT_EQ(column[13], binomial<std::int64_t>(13, 4));

  column.retreat();
  column.retreat();
  EXPECT_EQ(column.column_number(), 2);
  EXPECT_TRUE(column.is_valid());
  for (const auto &e : column.to_array()) {
    EXPECT_TRUE(e.is_valid()) << e;
  }
}

TEST(LazyColumn, LargestIntegerValues) {
  LazyColumn<> column(30);
  EXPECT_EQ(BigInt(column[64]), exact_binomial(64, 30));
  EXPECT_TRUE(column.is_cached(66));
  EXPECT_FALSE(column.is_cached(67));
  EXPECT_TRUE(column.is_valid());
  EXPECT_THROW(column[67], std::overflow_error);

  LazyColumn<> full(Column<>(29, 38));
  EXPECT_THROW(full.advance(), std::overflow_error);
  EXPECT_EQ(full, LazyColumn<>(Column<>(29, 38)));
}

TEST(LazyColumn, RetreatFloating) {
  LazyColumn<double> column(Column<double>(20, 30));
  column.retreat();
  EXPECT_EQ(column.column_number(), 19);
  EXPECT_TRUE(column.is_valid());
  EXPECT_EQ(to_column(column), Column<double>(19, 30));
}

TEST(LazyColumn, Print) {
  LazyColumn<> column(2);
  std::ostringstream os;
  os << column;
  EXPECT_EQ(os.str(), "LazyColumn(2){2 => 1}");
}

}  // namespace
}  // namespace pascal
