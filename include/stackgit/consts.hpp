#pragma once
#include <cstdint>
#include <string_view>

namespace stackgit::consts {

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeZero       = 0;
inline constexpr std::uint32_t kModeFile       = 0100644; // regular file
inline constexpr std::uint32_t kModeExecutable = 0100755;
inline constexpr std::uint32_t kModeSymlink    = 0120000;
inline constexpr std::uint32_t kModeTree       = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeGitlink    = 0160000; // submodule commit

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kShortHexLen = 7;

// Loose object store layout
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..."

// Hash of the tree with no entries.
inline constexpr std::string_view kEmptyTree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// Commit header prefixes
inline constexpr std::string_view kTreePrefix = "tree ";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kTab   = '\t';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';
inline constexpr char kSep   = '/';

// Name of the root directory in patch bookkeeping.
inline constexpr std::string_view kRootDir = ".";

// git merge-tree
inline constexpr std::string_view kMergeClean      = "1";
inline constexpr std::string_view kMergeConflicted = "0";

// Exit code used by tests that cannot run in the current environment.
inline constexpr int kSkipExitCode = 77;

} // namespace stackgit::consts
