#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>

#include "command.h"
#include "report.h"

namespace {

void usage() {
  std::cerr << "Usage: pascal (entry N K | row N | column C LEN"
               " | centre MAXROW) [--int | --float | --big]\n"
               "       pascal collisions MAXROW\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage();
    return 1;
  }

  std::string line;
  for (int i = 1; i < argc; ++i) {
    if (i > 1) {
      line += ' ';
    }
    line += argv[i];
  }

  const auto command = pascal::parse_command(line);
  if (!command) {
    std::cerr << "Can't parse \"" << line << "\"\n";
    usage();
    return 1;
  }

  try {
    std::cout << std::setprecision(std::numeric_limits<double>::max_digits10);
    pascal::report(*command, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Exception: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
