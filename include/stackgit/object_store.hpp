#pragma once
#include "stackgit/hash.hpp"
#include "stackgit/object.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <stop_token>
#include <string_view>
#include <vector>

namespace stackgit {

/**
 * Pull-based listing of a tree.
 *
 * next() yields entries until std::nullopt; errors (including ObjectNotFound
 * for an unknown tree) are thrown from next(). A listing cannot be restarted.
 * Call close() when stopping early: it releases whatever is producing the
 * entries. The destructor closes as a last resort.
 */
class TreeListing {
public:
  virtual ~TreeListing() = default;

  virtual auto next() -> std::optional<TreeEntry> = 0;
  virtual void close() noexcept = 0;

  // Drain the remaining entries.
  auto collect() -> std::vector<TreeEntry>;
};

struct ListTreeOptions {
  // List every blob below the tree, with names rewritten to full paths.
  bool recurse{false};
};

struct MakeTreeResult {
  Hash hash;
  std::size_t count{0};
};

/**
 * Content-addressed store of blobs and trees.
 *
 * Implementations are stateless per call and may be used from several
 * threads at once.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual auto write_blob(std::span<const std::uint8_t> bytes, std::stop_token stop = {})
      -> Hash = 0;

  // Stream the blob's content into `sink`. Throws ObjectNotFound.
  virtual void read_blob(const Hash &hash, std::ostream &sink, std::stop_token stop = {}) = 0;

  virtual auto list_tree(const Hash &tree, ListTreeOptions opts = {}, std::stop_token stop = {})
      -> std::unique_ptr<TreeListing> = 0;

  // Write a tree from entries with single-segment names, in any order.
  // Throws InvalidEntry for bad names, duplicates or a zero mode.
  virtual auto make_tree(std::span<const TreeEntry> entries, std::stop_token stop = {})
      -> MakeTreeResult = 0;

  // Hash of the object at `path` inside `treeish` (the tree itself for an
  // empty path). Throws ObjectNotFound.
  virtual auto hash_at(std::string_view treeish, std::string_view path,
                       std::stop_token stop = {}) -> Hash = 0;

  auto read_blob(const Hash &hash, std::stop_token stop = {}) -> std::vector<std::uint8_t>;
  auto write_blob(std::string_view text, std::stop_token stop = {}) -> Hash;
};

// Check the parts of an entry every store insists on.
// Throws InvalidEntry.
void validate_entry(const TreeEntry &entry);

// validate_entry() for each entry, and no name twice.
void validate_entries(std::span<const TreeEntry> entries);

} // namespace stackgit
