#include "stackgit/tree_patch.hpp"

#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/log.hpp"
#include "stackgit/util.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stackgit {

namespace {

// Pending edits to one directory, keyed by entry name.
struct DirectoryPatch {
  std::map<std::string, TreeEntry> writes;
  std::set<std::string> deletes;

  [[nodiscard]] bool empty() const { return writes.empty() && deletes.empty(); }
};

// Deepest directories first, so every subtree is rebuilt before its parent.
struct DeepestFirst {
  bool operator()(const std::string &a, const std::string &b) const {
    const auto da = pathutil::depth(a);
    const auto db = pathutil::depth(b);
    if (da != db) {
      return da > db;
    }
    return a < b;
  }
};

void check_stop(const std::stop_token &stop) {
  if (stop.stop_requested()) {
    throw Cancelled();
  }
}

// Linear merge of a directory's entries with its patch. Both sides are
// walked in name order; every write and delete that is applied is removed
// from the patch, and deletes that match nothing are dropped as no-ops.
// A name that is both written and deleted ends up deleted.
auto apply_patch(std::vector<TreeEntry> current, DirectoryPatch &patch) -> std::vector<TreeEntry> {
  std::ranges::sort(current, {}, &TreeEntry::name);

  std::vector<TreeEntry> out;
  out.reserve(current.size() + patch.writes.size());

  auto d = patch.deletes.begin();
  const auto deleted = [&](const std::string &name) {
    while (d != patch.deletes.end() && *d < name) {
      d = patch.deletes.erase(d);
    }
    if (d != patch.deletes.end() && *d == name) {
      d = patch.deletes.erase(d);
      return true;
    }
    return false;
  };

  auto w = patch.writes.begin();
  const auto emit_write = [&] {
    if (!deleted(w->first)) {
      out.push_back(std::move(w->second));
    }
    w = patch.writes.erase(w);
  };

  for (auto &e : current) {
    while (w != patch.writes.end() && w->first < e.name) {
      emit_write();
    }
    if (w != patch.writes.end() && w->first == e.name) {
      emit_write();
      continue;
    }
    if (!deleted(e.name)) {
      out.push_back(std::move(e));
    }
  }
  while (w != patch.writes.end()) {
    emit_write();
  }
  while (d != patch.deletes.end()) {
    d = patch.deletes.erase(d);
  }
  return out;
}

} // namespace

auto update_tree(ObjectStore &store, const UpdateTreeRequest &req, std::stop_token stop) -> Hash {
  if (req.writes.empty() && req.deletes.empty()) {
    return req.tree;
  }
  const std::string root{consts::kRootDir};

  std::map<std::string, DirectoryPatch> patches;
  std::set<std::string, DeepestFirst> affected;

  // A directory is affected when anything below it changes.
  const auto mark = [&](std::string dir) {
    while (affected.insert(dir).second && dir != root) {
      dir = pathutil::parent(dir);
    }
  };

  for (const auto &blob : req.writes) {
    pathutil::validate(blob.path);
    if (blob.hash.empty()) {
      throw InvalidEntry("no hash for \"" + blob.path + "\"");
    }
    auto [dir, name] = pathutil::split_dir(blob.path);
    const Mode mode = blob.mode == Mode::Zero ? Mode::Regular : blob.mode;
    patches[dir].writes.insert_or_assign(
        name, TreeEntry{.mode = mode, .kind = kind_for_mode(mode), .hash = blob.hash, .name = name});
    mark(std::move(dir));
  }
  for (const auto &path : req.deletes) {
    pathutil::validate(path);
    auto [dir, name] = pathutil::split_dir(path);
    patches[dir].deletes.insert(std::move(name));
    mark(std::move(dir));
  }

  auto logger = log::get();
  logger->debug("update-tree {}: {} writes, {} deletes, {} directories", req.tree.short_form(),
                req.writes.size(), req.deletes.size(), affected.size());

  std::optional<Hash> result;
  for (const auto &dir : affected) {
    check_stop(stop);

    DirectoryPatch patch;
    if (auto it = patches.find(dir); it != patches.end()) {
      patch = std::move(it->second);
      patches.erase(it);
    }

    std::vector<TreeEntry> current;
    if (!req.tree.is_zero()) {
      std::optional<Hash> dir_hash;
      if (dir == root) {
        dir_hash = store.hash_at(req.tree.str(), "", stop);
      } else {
        try {
          dir_hash = store.hash_at(req.tree.str(), dir, stop);
        } catch (const ObjectNotFound &) {
          logger->trace("update-tree: {} does not exist yet", dir);
        }
      }
      if (dir_hash) {
        current = store.list_tree(*dir_hash, {}, stop)->collect();
      }
    }

    auto entries = apply_patch(std::move(current), patch);
    if (!patch.empty()) {
      throw InternalInvariantViolation("update-tree: unconsumed edits left in \"" + dir + "\"");
    }

    if (dir == root) {
      // The root is written even when it ends up empty.
      result = store.make_tree(entries, stop).hash;
      logger->trace("update-tree: root: {} entries -> {}", entries.size(), result->short_form());
      continue;
    }

    auto &parent = patches[pathutil::parent(dir)];
    const std::string name = pathutil::basename(dir);
    const auto existing = parent.writes.find(name);

    if (entries.empty()) {
      // Prune. A blob written over the old directory takes its place.
      if (existing == parent.writes.end()) {
        parent.deletes.insert(name);
      }
      logger->trace("update-tree: {} is empty, pruned", dir);
      continue;
    }

    if (existing != parent.writes.end()) {
      throw InvalidEntry("\"" + dir + "\" would be both a file and a directory");
    }
    const auto made = store.make_tree(entries, stop);
    logger->trace("update-tree: {}: {} entries -> {}", dir, made.count, made.hash.short_form());

    // A delete of this name targets the blob that used to be here.
    parent.deletes.erase(name);
    parent.writes.emplace(name, TreeEntry{.mode = Mode::Directory,
                                          .kind = ObjectKind::Tree,
                                          .hash = made.hash,
                                          .name = name});
  }

  if (!patches.empty()) {
    throw InternalInvariantViolation("update-tree: edits queued for \"" + patches.begin()->first +
                                     "\" were never applied");
  }
  if (!result) {
    throw InternalInvariantViolation("update-tree: root tree was never written");
  }
  logger->debug("update-tree {} -> {}", req.tree.short_form(), result->short_form());
  return *result;
}

auto make_tree_recursive(ObjectStore &store, const std::vector<BlobInfo> &blobs,
                         std::stop_token stop) -> Hash {
  if (blobs.empty()) {
    return store.make_tree({}, stop).hash;
  }
  return update_tree(store, UpdateTreeRequest{.tree = Hash::zero(), .writes = blobs, .deletes = {}},
                     std::move(stop));
}

} // namespace stackgit
