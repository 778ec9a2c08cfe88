#pragma once
#include <stdexcept>

namespace stackgit::cli {

// argv[0] is the subcommand name. Returns the process exit code.
using command_fn = int (*)(int argc, char **argv);

// Thrown by a command when its arguments or input lines do not parse.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace stackgit::cli
