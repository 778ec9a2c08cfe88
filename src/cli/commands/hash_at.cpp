#include "cli/command.hpp"
#include "cli/context.hpp"

#include <iostream>
#include <string_view>

int cmd_hash_at(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    throw stackgit::cli::UsageError("expected a tree-ish and an optional path");
  }
  const auto opts = stackgit::cli::load_cli_options();
  stackgit::GitStore store{stackgit::cli::git_options(opts)};
  const std::string_view path = argc == 3 ? argv[2] : "";
  std::cout << store.hash_at(argv[1], path) << "\n";
  return 0;
}
