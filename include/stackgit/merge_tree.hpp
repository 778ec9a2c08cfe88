#pragma once
#include "stackgit/hash.hpp"
#include "stackgit/object.hpp"

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stackgit {

class GitStore;
class TokenReader;

struct MergeTreeRequest {
  // Commit-ish values, or any tree-ish when merge_base is set.
  std::string branch1;
  std::string branch2;

  // Explicit merge base. The difference between it and branch1 is applied
  // to branch2.
  std::string merge_base;

  // merge.conflictStyle for the content written into conflicted blobs
  // ("merge", "diff3", "zdiff3"). Empty: git's default.
  std::string conflict_style;
};

enum class ConflictStage : std::uint8_t {
  Ok = 0,     // not conflicted
  Base = 1,   // common ancestor
  Ours = 2,   // branch1
  Theirs = 3, // branch2
};

// Throws ProtocolError for anything but "0".."3".
auto parse_conflict_stage(std::string_view text) -> ConflictStage;
auto stage_name(ConflictStage stage) noexcept -> std::string_view;

struct MergeConflictFile {
  Mode mode{Mode::Zero};
  Hash object;
  ConflictStage stage{ConflictStage::Ok};
  std::string path;
};

// Informational message from the merge. These also cover paths that were
// resolved automatically, so an annotation alone does not mean a conflict.
struct MergeAnnotation {
  std::string type;    // stable tag, e.g. "Auto-merging", "CONFLICT (contents)"
  std::string message; // human readable, may change between git versions
  std::vector<std::string> paths;
};

struct MergeConflict {
  Hash tree; // best-effort result, with conflict markers in conflicted blobs
  std::vector<MergeConflictFile> files;
  std::vector<MergeAnnotation> annotations;

  // Unique conflicted paths in the order they first appear in `files`.
  [[nodiscard]] auto filenames() const -> std::vector<std::string>;

  // "conflicting files: a, b"
  [[nodiscard]] auto describe() const -> std::string;
};

// Clean tree hash, or a conflict. Failures are thrown.
using MergeTreeResult = std::variant<Hash, MergeConflict>;

// One merge as reported by git merge-tree.
struct MergeTreeOutput {
  bool clean{false};
  Hash tree;
  std::vector<MergeConflictFile> files;
  std::vector<MergeAnnotation> annotations;
};

// Parse "<mode> <object> <stage>\t<path>". Throws ProtocolError.
auto parse_conflict_file(std::string_view token) -> MergeConflictFile;

// Parse `git merge-tree --write-tree --stdin -z` output: one result per
// request, each starting with its "0"/"1" status token.
// Throws ProtocolError on malformed output.
auto parse_merge_tree_output(TokenReader &tokens) -> std::vector<MergeTreeOutput>;

// Parse one result whose status is already known (the tree hash and the
// sections that follow it). Used for the argv form of git merge-tree, whose
// status is its exit code.
auto parse_merge_tree_result(TokenReader &tokens, bool clean) -> MergeTreeOutput;

// Interpret the argv form of git merge-tree (2.38, no --stdin) from its
// stdout and exit code. Exit code 1 with no output is a failed merge, not a
// conflict. Throws StoreIOError or ProtocolError.
auto parse_exit_coded_result(std::string raw, int exit_code, std::string_view stderr_text)
    -> MergeTreeOutput;

// Turn a parsed result into the caller-facing outcome: a result without
// conflicted files is clean, whatever annotations it carries.
auto to_merge_result(MergeTreeOutput output) -> MergeTreeResult;

/**
 * Merge two commit-ish (or, with a merge base, tree-ish) values without
 * touching the index or working tree.
 *
 * Returns the merged tree hash, or a MergeConflict describing the conflicted
 * files. Auto-merged paths that need no user action do not count as
 * conflicts. Throws StoreIOError, ProtocolError or Cancelled.
 */
auto merge_tree(GitStore &git, const MergeTreeRequest &req, std::stop_token stop = {})
    -> MergeTreeResult;

} // namespace stackgit
