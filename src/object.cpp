#include "stackgit/object.hpp"

#include "stackgit/errors.hpp"

#include <array>
#include <cstdio>
#include <string>

namespace stackgit {

Mode parse_mode(std::string_view text) {
  if (text.empty() || text.size() > 7) {
    throw InvalidEntry("invalid mode: \"" + std::string(text) + "\"");
  }
  std::uint32_t v = 0;
  for (const char c : text) {
    if (c < '0' || c > '7') {
      throw InvalidEntry("invalid mode: \"" + std::string(text) + "\"");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return static_cast<Mode>(v);
}

std::string format_mode(Mode mode) {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%06o", static_cast<unsigned>(mode));
  return {buf.data()};
}

ObjectKind parse_kind(std::string_view text) {
  if (text == consts::kTypeBlob) {
    return ObjectKind::Blob;
  }
  if (text == consts::kTypeTree) {
    return ObjectKind::Tree;
  }
  if (text == consts::kTypeCommit) {
    return ObjectKind::Commit;
  }
  throw InvalidEntry("invalid object type: \"" + std::string(text) + "\"");
}

std::string_view kind_name(ObjectKind kind) noexcept {
  switch (kind) {
  case ObjectKind::Blob:
    return consts::kTypeBlob;
  case ObjectKind::Tree:
    return consts::kTypeTree;
  case ObjectKind::Commit:
    return consts::kTypeCommit;
  }
  return consts::kTypeBlob;
}

ObjectKind kind_for_mode(Mode mode) noexcept {
  switch (mode) {
  case Mode::Directory:
    return ObjectKind::Tree;
  case Mode::Gitlink:
    return ObjectKind::Commit;
  default:
    return ObjectKind::Blob;
  }
}

std::string format_entry(const TreeEntry &entry) {
  std::string out = format_mode(entry.mode);
  out.push_back(consts::kSpace);
  out.append(kind_name(entry.kind));
  out.push_back(consts::kSpace);
  out.append(entry.hash.str());
  out.push_back(consts::kTab);
  out.append(entry.name);
  return out;
}

TreeEntry parse_entry(std::string_view record) {
  // <mode> SP <kind> SP <hash> TAB <name>
  const auto tab = record.find(consts::kTab);
  if (tab == std::string_view::npos) {
    throw ProtocolError("tree entry without a name: \"" + std::string(record) + "\"");
  }
  const std::string_view head = record.substr(0, tab);
  const auto sp1 = head.find(consts::kSpace);
  const auto sp2 = sp1 == std::string_view::npos ? sp1 : head.find(consts::kSpace, sp1 + 1);
  if (sp2 == std::string_view::npos || head.find(consts::kSpace, sp2 + 1) != std::string_view::npos) {
    throw ProtocolError("malformed tree entry: \"" + std::string(record) + "\"");
  }

  TreeEntry e{};
  try {
    e.mode = parse_mode(head.substr(0, sp1));
    e.kind = parse_kind(head.substr(sp1 + 1, sp2 - sp1 - 1));
  } catch (const InvalidEntry &err) {
    throw ProtocolError(std::string("malformed tree entry: ") + err.what());
  }
  e.hash = Hash{std::string(head.substr(sp2 + 1))};
  e.name = std::string(record.substr(tab + 1));
  if (e.hash.empty() || e.name.empty()) {
    throw ProtocolError("malformed tree entry: \"" + std::string(record) + "\"");
  }
  return e;
}

} // namespace stackgit
