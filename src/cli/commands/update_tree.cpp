#include "cli/command.hpp"
#include "cli/context.hpp"

#include "stackgit/object.hpp"
#include "stackgit/tree_patch.hpp"

#include <iostream>
#include <string>

// Reads "<mode> SP <hash> TAB <path>" lines; mode 000000 deletes the path.
int cmd_update_tree(int argc, char **argv) {
  if (argc != 2) {
    throw stackgit::cli::UsageError("expected one tree");
  }
  const auto opts = stackgit::cli::load_cli_options();
  stackgit::GitStore store{stackgit::cli::git_options(opts)};

  stackgit::UpdateTreeRequest req{.tree = stackgit::Hash{argv[1]}, .writes = {}, .deletes = {}};
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty())
      continue;
    const auto sp = line.find(' ');
    const auto tab = line.find('\t');
    if (sp == std::string::npos || tab == std::string::npos || tab < sp) {
      throw stackgit::cli::UsageError("malformed edit: " + line);
    }
    const auto mode = stackgit::parse_mode(line.substr(0, sp));
    std::string path = line.substr(tab + 1);
    if (mode == stackgit::Mode::Zero) {
      req.deletes.push_back(std::move(path));
    } else {
      req.writes.push_back(stackgit::BlobInfo{.mode = mode,
                                              .hash = stackgit::Hash{line.substr(sp + 1, tab - sp - 1)},
                                              .path = std::move(path)});
    }
  }

  std::cout << stackgit::update_tree(store, req) << "\n";
  return 0;
}
