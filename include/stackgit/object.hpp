#pragma once
#include "stackgit/consts.hpp"
#include "stackgit/hash.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace stackgit {

// Octal file mode of a tree entry. Values outside the named set are kept
// as-is so that whatever the store reports survives a round trip.
enum class Mode : std::uint32_t {
  Zero       = consts::kModeZero,
  Regular    = consts::kModeFile,
  Executable = consts::kModeExecutable,
  Symlink    = consts::kModeSymlink,
  Directory  = consts::kModeTree,
  Gitlink    = consts::kModeGitlink,
};

// Parse an octal mode ("100644", "40000", ...). Throws InvalidEntry.
Mode parse_mode(std::string_view text);

// Six-digit zero-padded octal, e.g. "040000".
std::string format_mode(Mode mode);

enum class ObjectKind : std::uint8_t { Blob, Tree, Commit };

// Throws InvalidEntry for anything but "blob", "tree" or "commit".
ObjectKind parse_kind(std::string_view text);
std::string_view kind_name(ObjectKind kind) noexcept;

// Kind implied by a mode: directories are trees, gitlinks are commits.
ObjectKind kind_for_mode(Mode mode) noexcept;

// One child of a tree. `name` is a single path segment.
struct TreeEntry {
  Mode mode{Mode::Zero};
  ObjectKind kind{ObjectKind::Blob};
  Hash hash;
  std::string name;

  bool operator==(const TreeEntry &) const = default;
};

// Blob to place at `path`, which may span several directories.
// A zero mode is written as a regular file.
struct BlobInfo {
  Mode mode{Mode::Zero};
  Hash hash;
  std::string path;
};

// "<mode> SP <kind> SP <hash> TAB <name>", the ls-tree/mktree record.
std::string format_entry(const TreeEntry &entry);

// Inverse of format_entry. Throws ProtocolError on a malformed record.
TreeEntry parse_entry(std::string_view record);

} // namespace stackgit
