#include "stackgit/object_store.hpp"

#include "stackgit/errors.hpp"

#include <sstream>
#include <string>
#include <unordered_set>

namespace stackgit {

auto TreeListing::collect() -> std::vector<TreeEntry> {
  std::vector<TreeEntry> out;
  while (auto e = next()) {
    out.push_back(std::move(*e));
  }
  return out;
}

auto ObjectStore::read_blob(const Hash &hash, std::stop_token stop) -> std::vector<std::uint8_t> {
  std::ostringstream sink;
  read_blob(hash, sink, std::move(stop));
  const std::string s = std::move(sink).str();
  return {s.begin(), s.end()};
}

auto ObjectStore::write_blob(std::string_view text, std::stop_token stop) -> Hash {
  return write_blob(std::span<const std::uint8_t>(
                        reinterpret_cast<const std::uint8_t *>(text.data()), text.size()),
                    std::move(stop));
}

void validate_entry(const TreeEntry &entry) {
  if (entry.name.empty()) {
    throw InvalidEntry("tree entry without a name");
  }
  if (entry.name.find('/') != std::string::npos) {
    throw InvalidEntry("name \"" + entry.name + "\" contains a slash");
  }
  if (entry.name.find('\0') != std::string::npos || entry.name == "." || entry.name == "..") {
    throw InvalidEntry("invalid name \"" + entry.name + "\"");
  }
  if (entry.mode == Mode::Zero) {
    throw InvalidEntry("mode not set for \"" + entry.name + "\"");
  }
  if (entry.hash.empty()) {
    throw InvalidEntry("hash not set for \"" + entry.name + "\"");
  }
  if ((entry.kind == ObjectKind::Tree) != (entry.mode == Mode::Directory)) {
    throw InvalidEntry("type does not match mode for \"" + entry.name + "\"");
  }
}

void validate_entries(std::span<const TreeEntry> entries) {
  std::unordered_set<std::string_view> names;
  for (const auto &e : entries) {
    validate_entry(e);
    if (!names.insert(e.name).second) {
      throw InvalidEntry("duplicate entry \"" + e.name + "\"");
    }
  }
}

} // namespace stackgit
