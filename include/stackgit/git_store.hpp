#pragma once
#include "stackgit/object_store.hpp"
#include "stackgit/process.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stackgit {

// Where and how to run git. Passed explicitly to every GitStore so that
// several repositories can be driven side by side.
struct GitOptions {
  std::filesystem::path executable{"git"};
  std::filesystem::path work_dir;  // repository (or worktree) to operate on
  std::vector<std::string> env;    // extra KEY=VALUE entries
};

struct GitVersion {
  int major{0};
  int minor{0};
  int patch{0};

  auto operator<=>(const GitVersion &) const = default;
};

// Parse "git version 2.39.5" (vendor suffixes are ignored).
// Throws ProtocolError.
auto parse_git_version(std::string_view text) -> GitVersion;

/**
 * ObjectStore backed by the git executable, one process per call.
 */
class GitStore final : public ObjectStore {
public:
  explicit GitStore(GitOptions opts) : opts_(std::move(opts)) {}

  using ObjectStore::read_blob;
  using ObjectStore::write_blob;

  auto write_blob(std::span<const std::uint8_t> bytes, std::stop_token stop = {})
      -> Hash override;
  void read_blob(const Hash &hash, std::ostream &sink, std::stop_token stop = {}) override;
  auto list_tree(const Hash &tree, ListTreeOptions opts = {}, std::stop_token stop = {})
      -> std::unique_ptr<TreeListing> override;
  auto make_tree(std::span<const TreeEntry> entries, std::stop_token stop = {})
      -> MakeTreeResult override;
  auto hash_at(std::string_view treeish, std::string_view path, std::stop_token stop = {})
      -> Hash override;

  // Version of the configured executable, detected once.
  auto version(std::stop_token stop = {}) -> GitVersion;

  // Process options for "git <args...>" under this store's settings.
  [[nodiscard]] auto command(std::vector<std::string> args) const -> ProcessOptions;

  // Run "git <args...>" and return its stdout with the trailing newline
  // removed. A non-zero exit is a StoreIOError carrying stderr.
  auto output(std::vector<std::string> args, std::string input = {}, std::stop_token stop = {})
      -> std::string;

  [[nodiscard]] auto options() const -> const GitOptions & { return opts_; }

private:
  GitOptions opts_;

  std::mutex version_mu_;
  std::optional<GitVersion> version_;
};

} // namespace stackgit
