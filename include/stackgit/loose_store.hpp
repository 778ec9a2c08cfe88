#pragma once
#include "stackgit/object_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stackgit {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

/**
 * Object store working directly on the loose-object layout of a git
 * directory: zlib-compressed "<type> <size>\0<payload>" files under
 * objects/aa/bbbb..., named by their SHA-1.
 *
 * Objects written here are byte-identical to the ones git writes, so a
 * LooseStore and a GitStore over the same repository agree on every hash.
 * Only loose objects are visible; packed objects are not read.
 */
class LooseStore final : public ObjectStore {
public:
  explicit LooseStore(std::filesystem::path gitdir) : gitdir_(std::move(gitdir)) {}

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

  // Read and decompress an object. Throws ObjectNotFound.
  [[nodiscard]] auto read(const Hash &hash) const -> Object;

  // Write object with given type/payload. Returns its hash.
  auto write(std::string_view type, std::span<const std::uint8_t> payload) const -> Hash;

  // Parse a tree object's entries, in stored order.
  [[nodiscard]] auto read_tree(const Hash &hash) const -> std::vector<TreeEntry>;

  [[nodiscard]] auto path_for_oid(const oid &object_id) const -> std::filesystem::path;
  [[nodiscard]] auto gitdir() const -> const std::filesystem::path & { return gitdir_; }

private:
  std::filesystem::path gitdir_;
};

} // namespace stackgit
