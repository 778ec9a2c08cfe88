#include "stackgit/merge_tree.hpp"

#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/git_store.hpp"
#include "stackgit/log.hpp"
#include "stackgit/process.hpp"
#include "stackgit/token_reader.hpp"

#include <algorithm>
#include <charconv>
#include <unordered_set>

namespace stackgit {

namespace {

// --write-tree appeared in 2.38, --stdin in 2.39, and --merge-base (with the
// "<base> -- " stdin form) in 2.40.
constexpr GitVersion kMergeTreeWriteTree{.major = 2, .minor = 38, .patch = 0};
constexpr GitVersion kMergeTreeStdin{.major = 2, .minor = 39, .patch = 0};
constexpr GitVersion kMergeTreeBase{.major = 2, .minor = 40, .patch = 0};

// Branch names travel on a whitespace-separated stdin line, or as argv
// entries that must not look like options.
void validate_rev(std::string_view what, std::string_view rev) {
  if (rev.empty()) {
    throw InvalidEntry(std::string(what) + " is required");
  }
  if (rev.front() == '-' ||
      std::ranges::any_of(rev, [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\0'; })) {
    throw InvalidEntry("invalid " + std::string(what) + ": \"" + std::string(rev) + "\"");
  }
}

auto expect_token(TokenReader &tokens, std::string_view what) -> std::string {
  auto tok = tokens.next();
  if (!tok) {
    throw ProtocolError("expected " + std::string(what) + ", got end of output");
  }
  return std::move(*tok);
}

} // namespace

auto parse_conflict_stage(std::string_view text) -> ConflictStage {
  if (text == "0") {
    return ConflictStage::Ok;
  }
  if (text == "1") {
    return ConflictStage::Base;
  }
  if (text == "2") {
    return ConflictStage::Ours;
  }
  if (text == "3") {
    return ConflictStage::Theirs;
  }
  throw ProtocolError("invalid conflict stage: \"" + std::string(text) + "\"");
}

auto stage_name(ConflictStage stage) noexcept -> std::string_view {
  switch (stage) {
  case ConflictStage::Ok:
    return "ok";
  case ConflictStage::Base:
    return "base";
  case ConflictStage::Ours:
    return "ours";
  case ConflictStage::Theirs:
    return "theirs";
  }
  return "unknown";
}

auto MergeConflict::filenames() const -> std::vector<std::string> {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto &f : files) {
    if (seen.insert(f.path).second) {
      out.push_back(f.path);
    }
  }
  return out;
}

auto MergeConflict::describe() const -> std::string {
  std::string msg = "conflicting files:";
  bool first = true;
  for (const auto &name : filenames()) {
    msg += first ? " " : ", ";
    msg += name;
    first = false;
  }
  return msg;
}

auto parse_conflict_file(std::string_view token) -> MergeConflictFile {
  // <mode> SP <object> SP <stage> TAB <path>
  const auto sp1 = token.find(consts::kSpace);
  if (sp1 == std::string_view::npos) {
    throw ProtocolError("expected <mode>, got end of record: \"" + std::string(token) + "\"");
  }
  MergeConflictFile file{};
  try {
    file.mode = parse_mode(token.substr(0, sp1));
  } catch (const InvalidEntry &e) {
    throw ProtocolError(e.what());
  }

  std::string_view rest = token.substr(sp1 + 1);
  const auto sp2 = rest.find(consts::kSpace);
  if (sp2 == std::string_view::npos || sp2 == 0) {
    throw ProtocolError("expected <object>, got end of record: \"" + std::string(token) + "\"");
  }
  file.object = Hash{std::string(rest.substr(0, sp2))};

  rest = rest.substr(sp2 + 1);
  const auto tab = rest.find(consts::kTab);
  if (tab == std::string_view::npos || tab + 1 == rest.size()) {
    throw ProtocolError("expected <stage> and <path>, got end of record: \"" +
                        std::string(token) + "\"");
  }
  file.stage = parse_conflict_stage(rest.substr(0, tab));
  file.path = std::string(rest.substr(tab + 1));
  return file;
}

auto parse_merge_tree_result(TokenReader &tokens, bool clean) -> MergeTreeOutput {
  MergeTreeOutput out{};
  out.clean = clean;

  // The tree hash is always present, conflicts or not.
  std::string tree = expect_token(tokens, "tree hash");
  if (tree.empty()) {
    throw ProtocolError("expected tree hash, got empty token");
  }
  out.tree = Hash{std::move(tree)};
  if (clean) {
    return out;
  }

  // Conflicted file info, ended by an empty token:
  //   <mode> SP <object> SP <stage> TAB <path> NUL
  for (;;) {
    const std::string tok = expect_token(tokens, "conflicted file info");
    if (tok.empty()) {
      break;
    }
    out.files.push_back(parse_conflict_file(tok));
  }

  // Informational messages, ended by an empty token or the end of output:
  //   <N> NUL <path1> NUL ... <pathN> NUL <type> NUL <message> NUL
  for (;;) {
    auto tok = tokens.next();
    if (!tok || tok->empty()) {
      break;
    }
    std::size_t count = 0;
    const char *last = tok->data() + tok->size();
    const auto [ptr, ec] = std::from_chars(tok->data(), last, count);
    if (ec != std::errc{} || ptr != last) {
      throw ProtocolError("expected <number-of-paths>, got \"" + *tok + "\"");
    }

    MergeAnnotation note{};
    note.paths.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      note.paths.push_back(expect_token(tokens, "path #" + std::to_string(i + 1)));
    }
    note.type = expect_token(tokens, "<conflict-type>");
    note.message = expect_token(tokens, "<conflict-message>");
    out.annotations.push_back(std::move(note));
  }
  return out;
}

auto parse_merge_tree_output(TokenReader &tokens) -> std::vector<MergeTreeOutput> {
  std::vector<MergeTreeOutput> outputs;
  for (;;) {
    // Each result starts with its merge status:
    //   0: merge had conflicts
    //   1: merge was clean
    auto status = tokens.next();
    if (!status || status->empty()) {
      break;
    }
    bool clean = false;
    if (*status == consts::kMergeClean) {
      clean = true;
    } else if (*status != consts::kMergeConflicted) {
      throw ProtocolError("expected '0' or '1', got \"" + *status + "\"");
    }
    outputs.push_back(parse_merge_tree_result(tokens, clean));
  }
  return outputs;
}

auto parse_exit_coded_result(std::string raw, int exit_code, std::string_view stderr_text)
    -> MergeTreeOutput {
  // Exit code 1 is both "conflicted" and "could not merge at all"; only the
  // first one leaves a tree on stdout.
  if ((exit_code != 0 && exit_code != 1) || (exit_code == 1 && raw.empty())) {
    throw StoreIOError(exit_message("git merge-tree", exit_code, stderr_text));
  }
  StringSource src{std::move(raw)};
  TokenReader tokens{src, '\0', Trailing::Reject};
  try {
    return parse_merge_tree_result(tokens, exit_code == 0);
  } catch (const ProtocolError &e) {
    if (exit_code != 0 && !stderr_text.empty()) {
      throw StoreIOError(exit_message("git merge-tree", exit_code, stderr_text));
    }
    throw ProtocolError(std::string("bad git merge-tree output: ") + e.what());
  }
}

auto to_merge_result(MergeTreeOutput output) -> MergeTreeResult {
  // git reports auto-merged paths as conflicted as well; only conflicted
  // file entries need user action.
  if (output.files.empty()) {
    return std::move(output.tree);
  }
  return MergeConflict{.tree = std::move(output.tree),
                       .files = std::move(output.files),
                       .annotations = std::move(output.annotations)};
}

auto merge_tree(GitStore &git, const MergeTreeRequest &req, std::stop_token stop)
    -> MergeTreeResult {
  validate_rev("branch1", req.branch1);
  validate_rev("branch2", req.branch2);
  if (!req.merge_base.empty()) {
    validate_rev("merge base", req.merge_base);
  }

  const GitVersion version = git.version(stop);
  if (version < kMergeTreeWriteTree) {
    throw StoreIOError("git merge-tree --write-tree requires git 2.38 or newer, found " +
                       std::to_string(version.major) + "." + std::to_string(version.minor));
  }
  if (!req.merge_base.empty() && version < kMergeTreeBase) {
    throw StoreIOError("git merge-tree with an explicit merge base requires git 2.40 or newer, found " +
                       std::to_string(version.major) + "." + std::to_string(version.minor));
  }
  const bool use_stdin = version >= kMergeTreeStdin;

  std::vector<std::string> args;
  if (!req.conflict_style.empty()) {
    args.emplace_back("-c");
    args.push_back("merge.conflictStyle=" + req.conflict_style);
  }
  args.emplace_back("merge-tree");
  args.emplace_back("--write-tree"); // other mode is deprecated
  args.emplace_back("-z");

  std::string input;
  if (use_stdin) {
    // Input is in the form:
    //   [<base> -- ]<branch1> <branch2> NL
    args.emplace_back("--stdin");
    if (!req.merge_base.empty()) {
      input = req.merge_base + " -- ";
    }
    input += req.branch1 + " " + req.branch2 + "\n";
  } else {
    args.push_back(req.branch1);
    args.push_back(req.branch2);
  }

  Process proc{git.command(std::move(args)), stop};
  std::optional<MergeTreeOutput> parsed;

  if (use_stdin) {
    proc.feed_stdin(std::move(input));
    ProcessStdout out{proc};
    TokenReader tokens{out, '\0', Trailing::Reject};

    std::optional<ProtocolError> bad_output;
    try {
      auto outputs = parse_merge_tree_output(tokens);
      if (outputs.size() != 1) {
        throw ProtocolError("expected one result from git merge-tree, got " +
                            std::to_string(outputs.size()));
      }
      parsed = std::move(outputs.front());
    } catch (const ProtocolError &e) {
      bad_output = e;
    }
    proc.drain_stdout();
    const int rc = proc.wait();
    if (proc.stop_requested()) {
      throw Cancelled();
    }
    // A failed process explains a garbled answer better than the parser.
    if (rc != 0) {
      throw StoreIOError(exit_message("git merge-tree", rc, proc.stderr_text()));
    }
    if (bad_output) {
      throw ProtocolError(std::string("bad git merge-tree output: ") + bad_output->what());
    }
  } else {
    // Without --stdin the status is the exit code, so the whole answer has
    // to be in hand before it can be interpreted.
    proc.close_stdin();
    std::string raw = proc.read_all_stdout();
    const int rc = proc.wait();
    if (proc.stop_requested()) {
      throw Cancelled();
    }
    parsed = parse_exit_coded_result(std::move(raw), rc, proc.stderr_text());
  }

  log::get()->debug("merge-tree {} {}{}: {} -> {} ({} conflicted entries, {} messages)",
                    req.branch1, req.branch2,
                    req.merge_base.empty() ? "" : " base " + req.merge_base,
                    parsed->clean ? "clean" : "conflicted", parsed->tree.short_form(),
                    parsed->files.size(), parsed->annotations.size());
  return to_merge_result(std::move(*parsed));
}

} // namespace stackgit
