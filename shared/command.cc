#include "command.h"

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pascal {

namespace {

struct VerbInfo {
  Verb verb;
  int arity;
  // Whether a value type flag may follow.
  bool typed;
};

const std::map<std::string, VerbInfo> verbs = {
    {"entry", {Verb::entry, 2, true}},
    {"row", {Verb::row, 1, true}},
    {"column", {Verb::column, 2, true}},
    {"centre", {Verb::centre, 1, true}},
    {"center", {Verb::centre, 1, true}},
    // The collision search always works in double.
    {"collisions", {Verb::collisions, 1, false}}};

const std::map<std::string, ValueKind> flags = {
    {"--int", ValueKind::integer},
    {"--float", ValueKind::floating},
    {"--big", ValueKind::big}};

}  // namespace

// Like the rest of the command parsing this reads words with
// std::istringstream. Each number is read from its own word so that
// trailing junk such as "5x" is rejected.
std::optional<Command> parse_command(const std::string &line) {
  std::istringstream iss(line);

  std::string word;
  if (!(iss >> word)) {
    return std::nullopt;
  }
  const auto found = verbs.find(word);
  if (found == verbs.end()) {
    return std::nullopt;
  }

  Command command{found->second.verb, {}, ValueKind::unspecified};
  for (int i = 0; i < found->second.arity; ++i) {
    if (!(iss >> word)) {
      return std::nullopt;
    }
    std::istringstream number(word);
    int arg;
    number >> arg;
    if (number.fail() || !number.eof() || arg < 0) {
      return std::nullopt;
    }
    command.args.push_back(arg);
  }

  if (iss >> word) {
    const auto flag = flags.find(word);
    if (flag == flags.end() || !found->second.typed) {
      return std::nullopt;
    }
    command.kind = flag->second;
  }
  if (iss >> word) {
    return std::nullopt;
  }
  return command;
}

}  // namespace pascal
