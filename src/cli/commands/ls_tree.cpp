#include "cli/command.hpp"
#include "cli/context.hpp"

#include "stackgit/object.hpp"

#include <iostream>
#include <string>

int cmd_ls_tree(int argc, char **argv) {
  bool recurse = false;
  std::string tree;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-r") {
      recurse = true;
    } else if (tree.empty()) {
      tree = arg;
    } else {
      throw stackgit::cli::UsageError("unexpected argument: " + arg);
    }
  }
  if (tree.empty()) {
    throw stackgit::cli::UsageError("expected a tree");
  }
  const auto opts = stackgit::cli::load_cli_options();
  stackgit::GitStore store{stackgit::cli::git_options(opts)};

  auto listing = store.list_tree(stackgit::Hash{tree}, {.recurse = recurse});
  while (auto e = listing->next()) {
    std::cout << stackgit::format_entry(*e) << "\n";
  }
  return 0;
}
