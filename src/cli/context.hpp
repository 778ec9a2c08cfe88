#pragma once
#include "stackgit/git_store.hpp"
#include "stackgit/options.hpp"

#include <exception>
#include <string_view>

namespace stackgit::cli {

// Options from the config file and environment; also applies the log level.
Options load_cli_options();

// A store handle for the repository in the current directory.
GitOptions git_options(const Options &opts);

// Print `e` prefixed with the command name and map it to an exit code:
// 128 for internal invariant violations, 1 otherwise.
int report_error(std::string_view cmd, const std::exception &e);

} // namespace stackgit::cli
