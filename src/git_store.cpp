#include "stackgit/git_store.hpp"

#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/log.hpp"
#include "stackgit/token_reader.hpp"
#include "stackgit/util.hpp"

#include <array>
#include <charconv>

namespace stackgit {

namespace {

// Entries of `git ls-tree -z`, produced while the caller pulls.
class GitTreeListing final : public TreeListing {
public:
  GitTreeListing(std::unique_ptr<Process> proc, Hash tree, bool recurse)
      : proc_(std::move(proc)), stdout_(*proc_), tokens_(stdout_), tree_(std::move(tree)),
        recurse_(recurse) {}

  ~GitTreeListing() override { close(); }

  auto next() -> std::optional<TreeEntry> override {
    while (!done_) {
      std::optional<std::string> record;
      try {
        record = tokens_.next();
      } catch (const StoreIOError &) {
        if (proc_->stop_requested()) {
          close();
          throw Cancelled();
        }
        throw;
      }
      if (!record) {
        finish();
        return std::nullopt;
      }
      TreeEntry e = parse_entry(*record);
      // ls-tree -r also reports submodule commits.
      if (recurse_ && e.kind != ObjectKind::Blob) {
        continue;
      }
      return e;
    }
    return std::nullopt;
  }

  // Stop early: kill the process and throw away what it still had to say.
  void close() noexcept override {
    if (done_) {
      return;
    }
    done_ = true;
    proc_->kill();
    proc_->drain_stdout();
    try {
      (void)proc_->wait();
    } catch (const StoreIOError &e) {
      log::get()->debug("ls-tree {}: {}", tree_.short_form(), e.what());
    }
  }

private:
  void finish() {
    done_ = true;
    const int rc = proc_->wait();
    if (proc_->stop_requested()) {
      throw Cancelled();
    }
    if (rc != 0) {
      throw ObjectNotFound(exit_message("git ls-tree " + tree_.str(), rc, proc_->stderr_text()));
    }
  }

  std::unique_ptr<Process> proc_;
  ProcessStdout stdout_;
  TokenReader tokens_;
  Hash tree_;
  bool recurse_;
  bool done_{false};
};

} // namespace

auto parse_git_version(std::string_view text) -> GitVersion {
  constexpr std::string_view kPrefix = "git version ";
  if (text.rfind(kPrefix, 0) != 0) {
    throw ProtocolError("unexpected git version output: \"" + std::string(text) + "\"");
  }
  text.remove_prefix(kPrefix.size());

  std::array<int, 3> parts{};
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const char *first = text.data();
    const char *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, parts[i]);
    if (ec != std::errc{}) {
      if (i < 2) {
        throw ProtocolError("unexpected git version output: \"" + std::string(text) + "\"");
      }
      break;
    }
    text.remove_prefix(static_cast<std::size_t>(ptr - first));
    if (text.empty() || text.front() != '.') {
      break;
    }
    text.remove_prefix(1);
  }
  return GitVersion{.major = parts[0], .minor = parts[1], .patch = parts[2]};
}

auto GitStore::command(std::vector<std::string> args) const -> ProcessOptions {
  return ProcessOptions{.executable = opts_.executable,
                        .args = std::move(args),
                        .work_dir = opts_.work_dir,
                        .env = opts_.env};
}

auto GitStore::output(std::vector<std::string> args, std::string input, std::stop_token stop)
    -> std::string {
  const std::string what = "git " + (args.empty() ? std::string{} : args.front());
  auto res = run_command(command(std::move(args)), std::move(input), std::move(stop));
  if (res.exit_code != 0) {
    throw StoreIOError(exit_message(what, res.exit_code, res.err));
  }
  return strutil::chomp(res.out);
}

auto GitStore::version(std::stop_token stop) -> GitVersion {
  const std::lock_guard lock(version_mu_);
  if (!version_) {
    version_ = parse_git_version(output({"version"}, {}, std::move(stop)));
    log::get()->debug("git version {}.{}.{}", version_->major, version_->minor, version_->patch);
  }
  return *version_;
}

auto GitStore::write_blob(std::span<const std::uint8_t> bytes, std::stop_token stop) -> Hash {
  std::string input(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  auto res = run_command(command({"hash-object", "-w", "--stdin", "-t", "blob"}),
                         std::move(input), std::move(stop));
  if (res.exit_code != 0) {
    throw StoreIOError(exit_message("git hash-object", res.exit_code, res.err));
  }
  return Hash{strutil::trim(res.out.substr(0, res.out.find(consts::kLF)))};
}

void GitStore::read_blob(const Hash &hash, std::ostream &sink, std::stop_token stop) {
  Process proc{command({"cat-file", "blob", hash.str()}), std::move(stop)};
  proc.close_stdin();

  std::array<char, 8192> buf{};
  for (;;) {
    const std::size_t n = proc.read_stdout(buf);
    if (n == 0) {
      break;
    }
    sink.write(buf.data(), static_cast<std::streamsize>(n));
    if (!sink) {
      proc.kill();
      proc.drain_stdout();
      (void)proc.wait();
      throw StoreIOError("read blob " + hash.str() + ": write to sink failed");
    }
  }
  const int rc = proc.wait();
  if (proc.stop_requested()) {
    throw Cancelled();
  }
  if (rc != 0) {
    throw ObjectNotFound(exit_message("git cat-file blob " + hash.str(), rc, proc.stderr_text()));
  }
}

auto GitStore::list_tree(const Hash &tree, ListTreeOptions opts, std::stop_token stop)
    -> std::unique_ptr<TreeListing> {
  std::vector<std::string> args{
      "ls-tree",
      "--full-tree", // don't limit listing to the current working directory
      "-z",
  };
  if (opts.recurse) {
    args.emplace_back("-r");
  }
  args.push_back(tree.str());

  auto proc = std::make_unique<Process>(command(std::move(args)), std::move(stop));
  proc->close_stdin();
  return std::make_unique<GitTreeListing>(std::move(proc), tree, opts.recurse);
}

auto GitStore::make_tree(std::span<const TreeEntry> entries, std::stop_token stop)
    -> MakeTreeResult {
  // mktree -z expects records of the form
  //   <mode> SP <type> SP <hash> TAB <name> NUL
  // git mktree takes duplicate names and writes a tree fsck rejects.
  validate_entries(entries);
  std::string input;
  for (const auto &e : entries) {
    input += format_entry(e);
    input.push_back(consts::kNul);
  }

  auto res = run_command(command({"mktree", "-z"}), std::move(input), std::move(stop));
  if (res.exit_code != 0) {
    throw StoreIOError(exit_message("git mktree", res.exit_code, res.err));
  }
  Hash hash{strutil::trim(strutil::chomp(res.out))};
  log::get()->trace("mktree: {} entries -> {}", entries.size(), hash.short_form());
  return MakeTreeResult{.hash = std::move(hash), .count = entries.size()};
}

auto GitStore::hash_at(std::string_view treeish, std::string_view path, std::stop_token stop)
    -> Hash {
  std::string rev(treeish);
  rev += ':';
  rev += path;
  auto res = run_command(command({"rev-parse",
                                  "--verify",         // fail if the object does not exist
                                  "--quiet",          // no output if object does not exist
                                  "--end-of-options", // prevent ref from being treated as a flag
                                  rev}),
                         {}, std::move(stop));
  std::string hash = strutil::chomp(res.out);
  if (res.exit_code != 0 || hash.empty()) {
    throw ObjectNotFound("\"" + rev + "\" does not exist");
  }
  return Hash{std::move(hash)};
}

} // namespace stackgit
