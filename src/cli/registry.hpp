#pragma once
#include <ostream>
#include <string>
#include <string_view>

#include "cli/command.hpp"

namespace stackgit::cli {

struct command {
  command_fn fn{nullptr};
  std::string args; // argument synopsis, e.g. "[-r] <tree>"
  std::string help;
};

void register_command(std::string name, command cmd);
const command *find_command(std::string_view name);
void print_usage(std::ostream &os);

// Run the subcommand named by argv[0]. Usage errors exit 2; failures are
// printed and mapped by report_error().
int dispatch(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace stackgit::cli
