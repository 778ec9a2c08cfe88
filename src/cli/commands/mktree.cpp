#include "cli/command.hpp"
#include "cli/context.hpp"

#include "stackgit/errors.hpp"
#include "stackgit/object.hpp"

#include <iostream>
#include <string>
#include <vector>

int cmd_mktree(int argc, char ** /*argv*/) {
  if (argc != 1) {
    throw stackgit::cli::UsageError("entries are read from stdin");
  }
  const auto opts = stackgit::cli::load_cli_options();
  stackgit::GitStore store{stackgit::cli::git_options(opts)};

  std::vector<stackgit::TreeEntry> entries;
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty())
      continue;
    try {
      entries.push_back(stackgit::parse_entry(line));
    } catch (const stackgit::ProtocolError &e) {
      throw stackgit::cli::UsageError(e.what());
    }
  }
  std::cout << store.make_tree(entries).hash << "\n";
  return 0;
}
