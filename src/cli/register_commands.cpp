#include "cli/registry.hpp"

int cmd_update_tree(int argc, char **argv);
int cmd_mktree(int argc, char **argv);
int cmd_ls_tree(int argc, char **argv);
int cmd_hash_at(int argc, char **argv);
int cmd_merge_tree(int argc, char **argv);

namespace stackgit::cli {

void register_all_commands() {
  register_command("update-tree", {.fn = ::cmd_update_tree,
                                   .args = "<tree> < edits",
                                   .help = "Apply \"<mode> <hash>\\t<path>\" edits to a tree "
                                           "(mode 000000 deletes)"});
  register_command("mktree", {.fn = ::cmd_mktree,
                              .args = "< entries",
                              .help = "Write a tree from ls-tree formatted entries"});
  register_command("ls-tree", {.fn = ::cmd_ls_tree,
                               .args = "[-r] <tree>",
                               .help = "List a tree; -r lists every blob by full path"});
  register_command("hash-at", {.fn = ::cmd_hash_at,
                               .args = "<treeish> [path]",
                               .help = "Print the object at a path in a tree-ish"});
  register_command("merge-tree", {.fn = ::cmd_merge_tree,
                                  .args = "[--base <b>] [--conflict-style <s>] <branch1> <branch2>",
                                  .help = "Merge two branches without a checkout; exits 1 on conflict"});
}

} // namespace stackgit::cli
