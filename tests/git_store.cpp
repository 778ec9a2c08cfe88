#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/git_store.hpp"
#include "stackgit/loose_store.hpp"
#include "stackgit/tree_patch.hpp"

#include "support.hpp"

#include <iostream>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

static std::string as_string(const std::vector<std::uint8_t> &v) { return {v.begin(), v.end()}; }

int main() {
  using namespace stackgit;

  // version parsing does not need git
  if (parse_git_version("git version 2.39.5") != GitVersion{2, 39, 5} ||
      parse_git_version("git version 2.42.0.windows.1") != GitVersion{2, 42, 0} ||
      parse_git_version("git version 2.40") != GitVersion{2, 40, 0} ||
      parse_git_version("git version 2.45.1 (Apple Git-154)") != GitVersion{2, 45, 1}) {
    std::cerr << "git version parsing mismatch\n";
    return 1;
  }
  try {
    (void)parse_git_version("hg version 6.0");
    std::cerr << "foreign version string accepted\n";
    return 1;
  } catch (const ProtocolError &) {
  }

  if (!test::have_git()) {
    std::cerr << "git not found, skipping\n";
    return consts::kSkipExitCode;
  }

  test::TempDir dir{"git_store"};
  try {
    test::init_repo(dir.path());
    GitStore git{test::isolated_git(dir.path())};
    LooseStore loose{dir.path() / ".git"};

    if (git.version() < GitVersion{2, 0, 0}) {
      std::cerr << "implausible git version\n";
      return 1;
    }

    // blobs, and agreement with the in-process store
    const Hash hello = git.write_blob("hello\n");
    if (hello.str() != "ce013625030ba8dba906f756967f9e9ca394464a") {
      std::cerr << "blob id mismatch: " << hello << "\n";
      return 1;
    }
    if (as_string(git.read_blob(hello)) != "hello\n" || as_string(loose.read_blob(hello)) != "hello\n") {
      std::cerr << "blob content mismatch\n";
      return 1;
    }
    std::string binary("a\0b\xff\n", 5);
    const Hash bin = git.write_blob(binary);
    if (loose.write_blob(binary) != bin || as_string(git.read_blob(bin)) != binary) {
      std::cerr << "binary blob mismatch\n";
      return 1;
    }
    try {
      (void)git.read_blob(Hash{"1111111111111111111111111111111111111111"});
      std::cerr << "reading a missing blob should fail\n";
      return 1;
    } catch (const ObjectNotFound &) {
    }

    // trees
    if (git.make_tree({}).hash.str() != consts::kEmptyTree) {
      std::cerr << "empty tree id mismatch\n";
      return 1;
    }
    const Hash sub = git.make_tree(std::vector<TreeEntry>{
                                       {.mode = Mode::Regular, .kind = ObjectKind::Blob, .hash = hello, .name = "c.txt"},
                                   })
                         .hash;
    const std::vector<TreeEntry> entries{
        {.mode = Mode::Directory, .kind = ObjectKind::Tree, .hash = sub, .name = "a"},
        {.mode = Mode::Executable, .kind = ObjectKind::Blob, .hash = bin, .name = "run me.sh"},
        {.mode = Mode::Regular, .kind = ObjectKind::Blob, .hash = hello, .name = "a.b"},
    };
    const auto made = git.make_tree(entries);
    if (made.count != 3 || loose.make_tree(entries).hash != made.hash) {
      std::cerr << "git and the loose store disagree on a tree\n";
      return 1;
    }

    const auto listed = git.list_tree(made.hash)->collect();
    if (listed != loose.list_tree(made.hash)->collect() || listed.size() != 3 ||
        listed[2].name != "run me.sh") {
      std::cerr << "listing mismatch\n";
      return 1;
    }
    const auto recursive = git.list_tree(made.hash, {.recurse = true})->collect();
    if (recursive != loose.list_tree(made.hash, {.recurse = true})->collect() ||
        recursive.size() != 3 || recursive[1].name != "a/c.txt") {
      std::cerr << "recursive listing mismatch\n";
      return 1;
    }
    {
      auto listing = git.list_tree(made.hash);
      (void)listing->next();
      listing->close();
      if (listing->next()) {
        std::cerr << "closed listing yielded an entry\n";
        return 1;
      }
    }
    {
      // abandoned without close(); the destructor cleans up
      auto listing = git.list_tree(made.hash, {.recurse = true});
      (void)listing->next();
    }
    auto missing = git.list_tree(Hash{"2222222222222222222222222222222222222222"});
    try {
      (void)missing->next();
      std::cerr << "listing a missing tree should fail\n";
      return 1;
    } catch (const ObjectNotFound &) {
    }

    if (git.hash_at(made.hash.str(), "") != made.hash || git.hash_at(made.hash.str(), "a/c.txt") != hello) {
      std::cerr << "hash_at mismatch\n";
      return 1;
    }
    try {
      (void)git.hash_at(made.hash.str(), "a/nope");
      std::cerr << "hash_at found a missing path\n";
      return 1;
    } catch (const ObjectNotFound &) {
    }

    // commits resolve to their tree
    const Hash commit{git.output({"commit-tree", made.hash.str(), "-m", "initial"})};
    if (git.hash_at(commit.str(), "a/c.txt") != hello || git.hash_at(commit.str(), "") != made.hash) {
      std::cerr << "commit-ish lookup mismatch\n";
      return 1;
    }

    // the patch engine gives the same answer over either store
    const UpdateTreeRequest req{.tree = made.hash,
                                .writes = {{.mode = Mode::Regular, .hash = hello, .path = "a/new/d.txt"},
                                           {.mode = Mode::Symlink, .hash = hello, .path = "link"}},
                                .deletes = {"a.b", "a/c.txt"}};
    const Hash via_git = update_tree(git, req);
    if (via_git != update_tree(loose, req)) {
      std::cerr << "update_tree differs between stores\n";
      return 1;
    }
    if (git.hash_at(via_git.str(), "a/new/d.txt") != hello) {
      std::cerr << "update_tree through git lost a write\n";
      return 1;
    }
    const auto fsck = run_command(git.command({"fsck", "--strict", "--no-dangling"}));
    if (fsck.exit_code != 0) {
      std::cerr << "git fsck failed: " << fsck.err << "\n";
      return 1;
    }

    // failures
    try {
      (void)git.make_tree(std::vector<TreeEntry>{
          {.mode = Mode::Regular, .kind = ObjectKind::Blob, .hash = hello, .name = "a/b"}});
      std::cerr << "slash in a tree entry name accepted\n";
      return 1;
    } catch (const InvalidEntry &) {
    }
    try {
      (void)git.make_tree(std::vector<TreeEntry>{
          {.mode = Mode::Regular, .kind = ObjectKind::Blob, .hash = hello, .name = "dup"},
          {.mode = Mode::Executable, .kind = ObjectKind::Blob, .hash = hello, .name = "dup"}});
      std::cerr << "duplicate tree entry names accepted\n";
      return 1;
    } catch (const InvalidEntry &) {
    }
    try {
      (void)git.output({"definitely-not-a-command"});
      std::cerr << "failing command did not throw\n";
      return 1;
    } catch (const StoreIOError &) {
    }
    GitStore nowhere{GitOptions{.executable = dir.path() / "no-such-git", .work_dir = dir.path(), .env = {}}};
    try {
      (void)nowhere.write_blob("x");
      std::cerr << "missing executable did not throw\n";
      return 1;
    } catch (const StoreIOError &) {
    }

    // cancellation
    std::stop_source stop;
    stop.request_stop();
    try {
      (void)git.write_blob("late\n", stop.get_token());
      std::cerr << "write_blob ignored the stop request\n";
      return 1;
    } catch (const Cancelled &) {
    }

    std::cout << "git store OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
