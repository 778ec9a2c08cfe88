#include "stackgit/loose_store.hpp"

#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/fs.hpp"
#include "stackgit/log.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <cstring>

namespace gfs = stackgit::fs;

namespace stackgit {

namespace {

void check_stop(const std::stop_token &stop) {
  if (stop.stop_requested()) {
    throw Cancelled();
  }
}

// Tree objects store modes without the leading zero ("40000").
auto mode_to_ascii_octal(Mode mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", static_cast<unsigned>(mode));
  return {buf.data()};
}

// git orders entries by name, comparing a directory as if its name ended
// in '/'.
auto tree_sort_key(const TreeEntry &e) -> std::string {
  return e.mode == Mode::Directory ? e.name + '/' : e.name;
}

auto peel_commit(const Object &commit) -> Hash {
  const std::string text(commit.data.begin(), commit.data.end());
  if (text.rfind(consts::kTreePrefix, 0) != 0 ||
      text.size() < consts::kTreePrefix.size() + consts::kOidHexLen) {
    throw ProtocolError("commit without a tree header");
  }
  return Hash{text.substr(consts::kTreePrefix.size(), consts::kOidHexLen)};
}

// Walks a tree lazily: nothing is read before the first next(), and
// subtrees are only opened when the walk reaches them.
class LooseTreeListing final : public TreeListing {
public:
  LooseTreeListing(const LooseStore &store, Hash root, bool recurse, std::stop_token stop)
      : store_(store), root_(std::move(root)), recurse_(recurse), stop_(std::move(stop)) {}

  ~LooseTreeListing() override { close(); }

  auto next() -> std::optional<TreeEntry> override {
    if (done_) {
      return std::nullopt;
    }
    if (!started_) {
      started_ = true;
      check_stop(stop_);
      frames_.push_back(Frame{.prefix = {}, .entries = store_.read_tree(root_)});
    }
    while (!frames_.empty()) {
      check_stop(stop_);
      Frame &top = frames_.back();
      if (top.next == top.entries.size()) {
        frames_.pop_back();
        continue;
      }
      TreeEntry e = top.entries[top.next++];
      if (!recurse_) {
        return e;
      }
      std::string full = top.prefix + e.name;
      if (e.kind == ObjectKind::Tree) {
        frames_.push_back(Frame{.prefix = full + '/', .entries = store_.read_tree(e.hash)});
        continue;
      }
      if (e.kind != ObjectKind::Blob) {
        continue;
      }
      e.name = std::move(full);
      return e;
    }
    done_ = true;
    return std::nullopt;
  }

  void close() noexcept override {
    frames_.clear();
    done_ = true;
  }

private:
  struct Frame {
    std::string prefix;
    std::vector<TreeEntry> entries;
    std::size_t next{0};
  };

  const LooseStore &store_;
  Hash root_;
  bool recurse_;
  std::stop_token stop_;
  bool started_{false};
  bool done_{false};
  std::vector<Frame> frames_;
};

} // namespace

auto LooseStore::path_for_oid(const oid &object_id) const -> std::filesystem::path {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

auto LooseStore::read(const Hash &hash) const -> Object {
  oid id{};
  if (!from_hex(hash.str(), id)) {
    throw ObjectNotFound("not a valid object name: \"" + hash.str() + "\"");
  }
  const auto path = path_for_oid(id);
  if (!std::filesystem::exists(path)) {
    throw ObjectNotFound("object " + hash.str() + " does not exist");
  }
  const std::vector<std::uint8_t> raw = gfs::inflate(gfs::read_file(path));

  // "<type> SP <size> NUL" + payload
  const std::string_view text(reinterpret_cast<const char *>(raw.data()), raw.size());
  const auto nul = text.find(consts::kNul);
  const auto sp = text.substr(0, nul).find(consts::kSpace);
  if (nul == std::string_view::npos || sp == std::string_view::npos) {
    throw ProtocolError("object " + hash.str() + ": invalid header");
  }
  std::size_t size = 0;
  const char *size_end = text.data() + nul;
  const auto [ptr, ec] = std::from_chars(text.data() + sp + 1, size_end, size);
  if (ec != std::errc{} || ptr != size_end || size != text.size() - nul - 1) {
    throw ProtocolError("object " + hash.str() + ": size does not match header");
  }
  return Object{.type = std::string(text.substr(0, sp)),
                .data = {raw.begin() + static_cast<std::ptrdiff_t>(nul + 1), raw.end()}};
}

auto LooseStore::write(std::string_view type, std::span<const std::uint8_t> payload) const
    -> Hash {
  // "<type> SP <size> NUL" + payload, hashed and compressed as one stream
  std::string header(type);
  header.push_back(consts::kSpace);
  header += std::to_string(payload.size());
  header.push_back(consts::kNul);
  const std::array<std::span<const std::uint8_t>, 2> parts{
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(header.data()),
                                    header.size()),
      payload};

  const oid id = sha1(parts);
  const auto path = path_for_oid(id);
  if (!std::filesystem::exists(path)) {
    gfs::publish_file(path, gfs::deflate(parts));
  }
  return Hash::from_oid(id);
}

auto LooseStore::read_tree(const Hash &hash) const -> std::vector<TreeEntry> {
  const auto [type, data] = read(hash);
  if (type != consts::kTypeTree) {
    throw ObjectNotFound("object " + hash.str() + " is a " + type + ", not a tree");
  }

  // Repeated "<octal mode> SP <name> NUL <20-byte id>"
  const std::string_view rest(reinterpret_cast<const char *>(data.data()), data.size());
  std::vector<TreeEntry> out;
  std::size_t pos = 0;
  while (pos < rest.size()) {
    const auto sp = rest.find(consts::kSpace, pos);
    const auto nul = sp == std::string_view::npos ? sp : rest.find(consts::kNul, sp + 1);
    if (nul == std::string_view::npos || rest.size() - nul - 1 < consts::kOidRawLen) {
      throw ProtocolError("tree " + hash.str() + ": truncated entry");
    }

    TreeEntry e{};
    try {
      e.mode = parse_mode(rest.substr(pos, sp - pos));
    } catch (const InvalidEntry &err) {
      throw ProtocolError("tree " + hash.str() + ": " + err.what());
    }
    e.kind = kind_for_mode(e.mode);
    e.name = std::string(rest.substr(sp + 1, nul - sp - 1));
    oid id{};
    std::memcpy(id.data(), rest.data() + nul + 1, consts::kOidRawLen);
    e.hash = Hash::from_oid(id);
    out.push_back(std::move(e));

    pos = nul + 1 + consts::kOidRawLen;
  }
  return out;
}

auto LooseStore::write_blob(std::span<const std::uint8_t> bytes, std::stop_token stop) -> Hash {
  check_stop(stop);
  return write(consts::kTypeBlob, bytes);
}

void LooseStore::read_blob(const Hash &hash, std::ostream &sink, std::stop_token stop) {
  check_stop(stop);
  const auto [type, data] = read(hash);
  if (type != consts::kTypeBlob) {
    throw ObjectNotFound("object " + hash.str() + " is a " + type + ", not a blob");
  }
  sink.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  if (!sink) {
    throw StoreIOError("read blob " + hash.str() + ": write to sink failed");
  }
}

auto LooseStore::list_tree(const Hash &tree, ListTreeOptions opts, std::stop_token stop)
    -> std::unique_ptr<TreeListing> {
  return std::make_unique<LooseTreeListing>(*this, tree, opts.recurse, std::move(stop));
}

auto LooseStore::make_tree(std::span<const TreeEntry> entries_in, std::stop_token stop)
    -> MakeTreeResult {
  check_stop(stop);

  validate_entries(entries_in);

  std::vector<TreeEntry> entries(entries_in.begin(), entries_in.end());
  std::ranges::sort(entries, [](const TreeEntry &a, const TreeEntry &b) {
    return tree_sort_key(a) < tree_sort_key(b);
  });

  std::string data;
  for (const auto &e : entries) {
    oid id{};
    if (!from_hex(e.hash.str(), id)) {
      throw InvalidEntry("entry \"" + e.name + "\" has an invalid hash: " + e.hash.str());
    }
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(id.data()), consts::kOidRawLen);
  }

  const auto payload = std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
  Hash hash = write(consts::kTypeTree, payload);
  log::get()->trace("loose mktree: {} entries -> {}", entries.size(), hash.short_form());
  return MakeTreeResult{.hash = std::move(hash), .count = entries.size()};
}

auto LooseStore::hash_at(std::string_view treeish, std::string_view path, std::stop_token stop)
    -> Hash {
  check_stop(stop);

  Hash cur{std::string(treeish)};
  const Object obj = read(cur);
  if (obj.type == consts::kTypeCommit) {
    cur = peel_commit(obj);
  } else if (obj.type != consts::kTypeTree) {
    throw ObjectNotFound("\"" + std::string(treeish) + "\" is not a tree-ish");
  }

  std::size_t start = 0;
  while (start < path.size()) {
    const std::size_t slash = path.find(consts::kSep, start);
    const std::string_view seg = path.substr(
        start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
    start = slash == std::string_view::npos ? path.size() : slash + 1;

    const auto entries = read_tree(cur);
    const auto it = std::ranges::find(entries, seg, &TreeEntry::name);
    if (it == entries.end()) {
      throw ObjectNotFound("path \"" + std::string(path) + "\" does not exist in " +
                           std::string(treeish));
    }
    if (start < path.size() && it->kind != ObjectKind::Tree) {
      throw ObjectNotFound("path \"" + std::string(path) + "\" does not exist in " +
                           std::string(treeish));
    }
    cur = it->hash;
  }
  return cur;
}

} // namespace stackgit
