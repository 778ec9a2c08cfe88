#include "stackgit/util.hpp"

#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"

#include <algorithm>

namespace stackgit {

namespace strutil {

auto trim(std::string_view sv) -> std::string {
  const auto first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(" \t\r");
  return std::string(sv.substr(first, last - first + 1));
}

auto chomp(std::string_view sv) -> std::string {
  const auto last = sv.find_last_not_of("\r\n");
  return last == std::string_view::npos ? std::string{} : std::string(sv.substr(0, last + 1));
}

} // namespace strutil

namespace pathutil {

auto split_dir(std::string_view path) -> std::pair<std::string, std::string> {
  const std::size_t pos = path.rfind(consts::kSep);
  if (pos == std::string_view::npos) {
    return {std::string(consts::kRootDir), std::string(path)};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}

auto parent(std::string_view dir) -> std::string {
  if (dir == consts::kRootDir) {
    return std::string(consts::kRootDir);
  }
  return split_dir(dir).first;
}

auto basename(std::string_view dir) -> std::string { return split_dir(dir).second; }

auto depth(std::string_view dir) -> std::size_t {
  if (dir == consts::kRootDir) {
    return 0;
  }
  return static_cast<std::size_t>(std::ranges::count(dir, consts::kSep)) + 1;
}

void validate(std::string_view path) {
  if (path.empty()) {
    throw InvalidEntry("empty path");
  }
  if (path.find(consts::kNul) != std::string_view::npos) {
    throw InvalidEntry("path contains NUL: \"" + std::string(path) + "\"");
  }
  std::size_t start = 0;
  for (;;) {
    const std::size_t end = path.find(consts::kSep, start);
    const std::string_view seg =
        path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (seg.empty() || seg == "." || seg == "..") {
      throw InvalidEntry("invalid path: \"" + std::string(path) + "\"");
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
}

} // namespace pathutil

} // namespace stackgit
