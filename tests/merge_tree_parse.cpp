#include "stackgit/errors.hpp"
#include "stackgit/merge_tree.hpp"
#include "stackgit/token_reader.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace std::string_literals;

namespace {

const std::string kTree = "d6cfa3a7a1e4b8c8e59a0c3f8b0dd0b6b0b3f1a2";
const std::string kBase = "1111111111111111111111111111111111111111";
const std::string kOurs = "2222222222222222222222222222222222222222";
const std::string kTheirs = "3333333333333333333333333333333333333333";

std::vector<stackgit::MergeTreeOutput> parse(const std::string &raw) {
  stackgit::StringSource src{raw};
  stackgit::TokenReader tokens{src, '\0', stackgit::Trailing::Reject};
  return stackgit::parse_merge_tree_output(tokens);
}

bool rejected(const std::string &raw) {
  try {
    (void)parse(raw);
  } catch (const stackgit::ProtocolError &) {
    return true;
  }
  return false;
}

// Conflicted result for file.txt with one auto-merge and one content conflict
// message, as written by merge-tree --stdin -z.
std::string conflicted_output() {
  std::string raw = "0\0"s + kTree + "\0"s;
  raw += "100644 " + kBase + " 1\tfile.txt\0"s;
  raw += "100644 " + kOurs + " 2\tfile.txt\0"s;
  raw += "100644 " + kTheirs + " 3\tfile.txt\0"s;
  raw += "\0"s;
  raw += "1\0file.txt\0Auto-merging\0Auto-merging file.txt\n\0"s;
  raw += "1\0file.txt\0CONFLICT (contents)\0CONFLICT (content): Merge conflict in file.txt\n\0"s;
  raw += "\0"s;
  return raw;
}

} // namespace

int main() {
  using namespace stackgit;

  try {
    // clean
    {
      const auto out = parse("1\0"s + kTree + "\0"s);
      if (out.size() != 1 || !out[0].clean || out[0].tree.str() != kTree ||
          !out[0].files.empty() || !out[0].annotations.empty()) {
        std::cerr << "clean result mismatch\n";
        return 1;
      }
      const auto result = to_merge_result(out[0]);
      if (!std::holds_alternative<Hash>(result) || std::get<Hash>(result).str() != kTree) {
        std::cerr << "clean result should be a tree hash\n";
        return 1;
      }
    }

    // conflicted
    {
      const auto out = parse(conflicted_output());
      if (out.size() != 1 || out[0].clean || out[0].tree.str() != kTree) {
        std::cerr << "conflicted result header mismatch\n";
        return 1;
      }
      const auto &files = out[0].files;
      if (files.size() != 3 || files[0].stage != ConflictStage::Base ||
          files[1].stage != ConflictStage::Ours || files[2].stage != ConflictStage::Theirs ||
          files[1].object.str() != kOurs || files[2].mode != Mode::Regular ||
          files[2].path != "file.txt") {
        std::cerr << "conflicted files mismatch\n";
        return 1;
      }
      const auto &notes = out[0].annotations;
      if (notes.size() != 2 || notes[0].type != "Auto-merging" ||
          notes[1].type != "CONFLICT (contents)" || notes[1].paths != std::vector<std::string>{"file.txt"} ||
          notes[1].message.find("Merge conflict in file.txt") == std::string::npos) {
        std::cerr << "annotations mismatch\n";
        return 1;
      }

      const auto result = to_merge_result(out[0]);
      const auto *conflict = std::get_if<MergeConflict>(&result);
      if (conflict == nullptr || conflict->tree.str() != kTree) {
        std::cerr << "conflicted result should be a MergeConflict\n";
        return 1;
      }
      if (conflict->filenames() != std::vector<std::string>{"file.txt"} ||
          conflict->describe() != "conflicting files: file.txt") {
        std::cerr << "describe: " << conflict->describe() << "\n";
        return 1;
      }
    }

    // annotations alone do not make a conflict
    {
      const std::string raw = "0\0"s + kTree + "\0\0"s +
                              "2\0old.txt\0new.txt\0CONFLICT (rename/delete)\0renamed\n\0"s;
      const auto out = parse(raw);
      if (out.size() != 1 || out[0].annotations.size() != 1 ||
          out[0].annotations[0].paths != std::vector<std::string>{"old.txt", "new.txt"}) {
        std::cerr << "annotation paths mismatch\n";
        return 1;
      }
      if (!std::holds_alternative<Hash>(to_merge_result(out[0]))) {
        std::cerr << "no conflicted files should mean a clean merge\n";
        return 1;
      }
    }

    // several results in one stream
    {
      const auto out = parse("1\0"s + kOurs + "\0"s + conflicted_output());
      if (out.size() != 2 || !out[0].clean || out[0].tree.str() != kOurs || out[1].clean ||
          out[1].files.size() != 3) {
        std::cerr << "multi-result stream mismatch\n";
        return 1;
      }
    }

    // the argv form: status comes from the exit code
    {
      StringSource src{kTree + "\0"s + "100644 " + kBase + " 2\tx\0\0"s};
      TokenReader tokens{src};
      const auto out = parse_merge_tree_result(tokens, false);
      if (out.clean || out.tree.str() != kTree || out.files.size() != 1 ||
          out.files[0].path != "x" || !out.annotations.empty()) {
        std::cerr << "argv-form result mismatch\n";
        return 1;
      }
    }

    // exit-coded results
    {
      const auto clean = parse_exit_coded_result(kTree + "\0"s, 0, "");
      const auto conflicted =
          parse_exit_coded_result(kTree + "\0"s + "100644 " + kBase + " 2\tx\0\0"s, 1, "");
      if (!clean.clean || clean.tree.str() != kTree || conflicted.clean ||
          conflicted.files.size() != 1) {
        std::cerr << "exit-coded result mismatch\n";
        return 1;
      }
      const std::vector<std::pair<std::string, int>> failures{
          {"", 1},            // exit 1 without a tree: git could not merge
          {kTree + "\0"s, 128}, // anything but 0 or 1
          {"x\0"s, 1},       // garbage with an explanation on stderr
      };
      for (const auto &[raw, rc] : failures) {
        try {
          (void)parse_exit_coded_result(raw, rc, "merge-tree: no-such-branch - not something we can merge");
          std::cerr << "exit code " << rc << " accepted\n";
          return 1;
        } catch (const StoreIOError &e) {
          if (std::string(e.what()).find("no-such-branch") == std::string::npos) {
            std::cerr << "stderr missing from: " << e.what() << "\n";
            return 1;
          }
        }
      }
      try {
        (void)parse_exit_coded_result(kTree, 0, "");
        std::cerr << "unterminated tree hash accepted\n";
        return 1;
      } catch (const ProtocolError &) {
      }
    }

    // strict and lenient trailing tokens
    {
      StringSource lenient_src{"a\0b"s};
      TokenReader lenient{lenient_src};
      StringSource strict_src{"a\0b"s};
      TokenReader strict{strict_src, '\0', Trailing::Reject};
      if (lenient.next() != "a" || lenient.next() != "b" || strict.next() != "a") {
        std::cerr << "trailing token handling mismatch\n";
        return 1;
      }
      try {
        (void)strict.next();
        std::cerr << "unterminated token accepted\n";
        return 1;
      } catch (const ProtocolError &) {
      }
    }

    // malformed output
    const std::vector<std::string> bad{
        "2\0"s + kTree + "\0"s,                                // unknown status
        "1\0"s,                                                // no tree
        "0\0"s + kTree + "\0"s + "100644 " + kBase + " 4\tf\0\0"s,  // bad stage
        "0\0"s + kTree + "\0"s + "100644 " + kBase + " 1\tf\0"s,    // files section never ends
        "0\0"s + kTree + "\0banana "s + kBase + " 1\tf\0\0"s,  // bad mode
        "0\0"s + kTree + "\0"s + "100644 " + kBase + " 1\0\0"s,     // no path
        "0\0"s + kTree + "\0\0x\0f\0type\0msg\0"s,             // path count not a number
        "0\0"s + kTree + "\0\0"s + "2\0f\0type\0"s,            // truncated annotation
        "1\0"s + kTree,                                      // tree hash cut off
        "0\0"s + kTree + "\0"s + "100644 " + kBase + " 2\tfi"s,  // path cut off
        "0\0"s + kTree + "\0\0"s + "1\0f\0type\0CONFLICT (con"s, // message cut off
    };
    for (std::size_t i = 0; i < bad.size(); ++i) {
      if (!rejected(bad[i])) {
        std::cerr << "malformed output #" << i << " was accepted\n";
        return 1;
      }
    }

    if (parse_conflict_stage("0") != ConflictStage::Ok || stage_name(ConflictStage::Theirs) != "theirs") {
      std::cerr << "stage helpers mismatch\n";
      return 1;
    }

    std::cout << "merge-tree parsing OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
