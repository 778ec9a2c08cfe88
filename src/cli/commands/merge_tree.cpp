#include "cli/command.hpp"
#include "cli/context.hpp"

#include "stackgit/merge_tree.hpp"
#include "stackgit/util.hpp"

#include <iostream>
#include <string>
#include <variant>

namespace {

void print_conflict(const stackgit::MergeConflict &conflict) {
  std::cout << conflict.tree << "\n";
  for (const auto &f : conflict.files) {
    std::cout << stackgit::format_mode(f.mode) << " " << f.object << " "
              << static_cast<int>(f.stage) << "\t" << f.path << "\n";
  }
  for (const auto &a : conflict.annotations) {
    std::cout << "\n" << a.type << ":";
    for (const auto &p : a.paths)
      std::cout << " " << p;
    std::cout << "\n  " << stackgit::strutil::chomp(a.message) << "\n";
  }
}

} // namespace

int cmd_merge_tree(int argc, char **argv) {
  stackgit::MergeTreeRequest req;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--base" || arg == "--conflict-style") {
      if (i + 1 == argc) {
        throw stackgit::cli::UsageError(arg + " needs a value");
      }
      (arg == "--base" ? req.merge_base : req.conflict_style) = argv[++i];
    } else if (req.branch1.empty()) {
      req.branch1 = arg;
    } else if (req.branch2.empty()) {
      req.branch2 = arg;
    } else {
      throw stackgit::cli::UsageError("unexpected argument: " + arg);
    }
  }
  if (req.branch2.empty()) {
    throw stackgit::cli::UsageError("expected two branches");
  }

  const auto opts = stackgit::cli::load_cli_options();
  if (req.conflict_style.empty())
    req.conflict_style = opts.merge_conflict_style;
  stackgit::GitStore store{stackgit::cli::git_options(opts)};

  const auto result = stackgit::merge_tree(store, req);
  if (const auto *tree = std::get_if<stackgit::Hash>(&result)) {
    std::cout << *tree << "\n";
    return 0;
  }
  const auto &conflict = std::get<stackgit::MergeConflict>(result);
  print_conflict(conflict);
  std::cerr << conflict.describe() << "\n";
  return 1;
}
