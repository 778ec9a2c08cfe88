#pragma once
#include "stackgit/hash.hpp"
#include "stackgit/object.hpp"
#include "stackgit/object_store.hpp"

#include <stop_token>
#include <string>
#include <vector>

namespace stackgit {

struct UpdateTreeRequest {
  Hash tree;                        // base tree; zero for "no tree"
  std::vector<BlobInfo> writes;     // paths may contain '/'
  std::vector<std::string> deletes; // paths of blobs to remove
};

/**
 * Apply blob writes and deletes to an existing tree and return the hash of
 * the new tree.
 *
 * Only directories on the way from an edited path up to the root are read
 * and rewritten; every other subtree is reused by hash. Missing directories
 * are created, and directories left empty are pruned (the root is always
 * written, possibly as the empty tree). Deleting a path that does not exist
 * is not an error.
 *
 * With no writes and no deletes the base tree is returned as-is.
 *
 * Throws InvalidEntry for malformed paths or for a path that would be both a
 * file and a directory, Cancelled if `stop` fires, and passes store errors
 * through unchanged.
 */
auto update_tree(ObjectStore &store, const UpdateTreeRequest &req, std::stop_token stop = {})
    -> Hash;

// Build a new tree holding exactly `blobs`, creating subtrees as needed.
auto make_tree_recursive(ObjectStore &store, const std::vector<BlobInfo> &blobs,
                         std::stop_token stop = {}) -> Hash;

} // namespace stackgit
