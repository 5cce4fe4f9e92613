#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <iostream>
#include <random>
#include <vector>

#include "binomial.h"
#include "row.h"

// Compares calculating rows of Pascal's triangle directly, one binomial
// coefficient at a time, against the movement based Row.

namespace {

constexpr int kMaxRow = 50;
constexpr int kNumRows = 100;
constexpr int kRepeats = 2000;

// Keeps the optimizer from discarding the work.
std::int64_t sink = 0;

std::vector<std::int64_t> binomial_row(int n) {
  std::vector<std::int64_t> row;
  row.reserve(n + 1);
  for (int k = 0; k <= n; ++k) {
    row.push_back(pascal::binomial<std::int64_t>(n, k));
  }
  return row;
}

void random_rows_binomial(const std::vector<int>& rownums) {
  for (const int n : rownums) {
    sink += binomial_row(n).back();
  }
}

void random_rows_pascal(const std::vector<int>& rownums) {
  for (const int n : rownums) {
    sink += pascal::Row<>(n)[n / 2];
  }
}

void all_rows_binomial(int max_row) {
  for (int n = 0; n <= max_row; ++n) {
    sink += binomial_row(n)[n / 2];
  }
}

void all_rows_pascal(int max_row) {
  auto row = pascal::Row<>::reserved(0, max_row);
  for (int n = 1; n <= max_row; ++n) {
    row.advance();
    sink += row[n / 2];
  }
}

void measure(const char* name, const std::function<void()>& work) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < kRepeats; ++i) {
    work();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start);
  std::cout << std::format("{:<20} {:>10.1f} us\n", name,
                           elapsed.count() / 1000.0 / kRepeats);
}

}  // namespace

int main() {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> dist(0, kMaxRow);
  std::vector<int> rownums(kNumRows);
  for (int& n : rownums) {
    n = dist(rng);
  }

  measure("binomial rows", [&rownums]() { random_rows_binomial(rownums); });
  measure("Row", [&rownums]() { random_rows_pascal(rownums); });
  measure("binomial all rows", []() { all_rows_binomial(kMaxRow); });
  measure("Row advance", []() { all_rows_pascal(kMaxRow); });

  std::cout << "checksum " << sink << "\n";
  return 0;
}
