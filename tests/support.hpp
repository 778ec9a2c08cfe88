#pragma once
// Shared fixtures for the test programs.
#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/git_store.hpp"
#include "stackgit/process.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace stackgit::test {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  explicit TempDir(std::string_view tag)
      : path_(fs::temp_directory_path() /
              ("stackgit_" + std::string(tag) + "_" + std::to_string(std::random_device{}()))) {
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

// git settings that do not depend on the user's configuration.
inline GitOptions isolated_git(const fs::path &work_dir) {
  return GitOptions{.executable = "git",
                    .work_dir = work_dir,
                    .env = {
                        "GIT_CONFIG_NOSYSTEM=1",
                        "GIT_CONFIG_GLOBAL=/dev/null",
                        "GIT_AUTHOR_NAME=Test User",
                        "GIT_AUTHOR_EMAIL=test@example.com",
                        "GIT_AUTHOR_DATE=1700000000 +0000",
                        "GIT_COMMITTER_NAME=Test User",
                        "GIT_COMMITTER_EMAIL=test@example.com",
                        "GIT_COMMITTER_DATE=1700000000 +0000",
                    }};
}

inline bool have_git() {
  try {
    return run_command(ProcessOptions{.executable = "git", .args = {"version"}, .work_dir = {}, .env = {}})
               .exit_code == 0;
  } catch (const StoreIOError &) {
    return false;
  }
}

// `git init` a fresh repository at `dir`. Throws StoreIOError on failure.
inline void init_repo(const fs::path &dir) {
  auto opts = isolated_git(dir);
  const auto res = run_command(ProcessOptions{
      .executable = opts.executable, .args = {"init", "-q", "."}, .work_dir = dir, .env = opts.env});
  if (res.exit_code != 0) {
    throw StoreIOError(exit_message("git init", res.exit_code, res.err));
  }
}

} // namespace stackgit::test
