#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace stackgit {

namespace strutil {
// Without leading/trailing spaces and tabs (and a trailing CR).
auto trim(std::string_view sv) -> std::string;
// Without the trailing CR/LF run.
auto chomp(std::string_view sv) -> std::string;
} // namespace strutil

// Slash-separated path helpers. The root directory is spelled ".".
namespace pathutil {
// "a/b/c" -> {"a/b", "c"}; "c" -> {".", "c"}
auto split_dir(std::string_view path) -> std::pair<std::string, std::string>;
// "a/b" -> "a"; "a" -> "."; "." -> "."
auto parent(std::string_view dir) -> std::string;
// "a/b" -> "b"
auto basename(std::string_view dir) -> std::string;
// Number of segments; "." has depth 0.
auto depth(std::string_view dir) -> std::size_t;
// Throws InvalidEntry unless `path` is a clean relative path:
// non-empty segments, no "." or "..", no NUL, no leading/trailing slash.
void validate(std::string_view path);
} // namespace pathutil

} // namespace stackgit
