#pragma once

#include <ostream>

#include "command.h"

namespace pascal {

// Carries out a parsed command, writing the results to out.
void report(const Command &command, std::ostream &out);

}  // namespace pascal
