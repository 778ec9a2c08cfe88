#include "stackgit/consts.hpp"
#include "stackgit/errors.hpp"
#include "stackgit/hash.hpp"
#include "stackgit/object.hpp"
#include "stackgit/options.hpp"
#include "stackgit/token_reader.hpp"
#include "stackgit/util.hpp"

#include "support.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace std::string_literals;

template <typename E, typename F> static bool throws(F &&f) {
  try {
    f();
  } catch (const E &) {
    return true;
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
  }
  return false;
}

int main() {
  using namespace stackgit;

  try {
    // object ids
    const Hash hello = Hash::from_oid(sha1(std::string_view("blob 6\0hello\n", 13)));
    if (hello.str() != "ce013625030ba8dba906f756967f9e9ca394464a") {
      std::cerr << "blob id mismatch: " << hello << "\n";
      return 1;
    }
    if (hello.short_form() != "ce01362") {
      std::cerr << "short form: " << hello.short_form() << "\n";
      return 1;
    }
    oid raw{};
    if (!from_hex(hello.str(), raw) || to_hex(raw) != hello.str()) {
      std::cerr << "hex round trip failed\n";
      return 1;
    }
    if (from_hex("xyz", raw) || from_hex(std::string(40, 'g'), raw) ||
        !from_hex("CE013625030BA8DBA906F756967F9E9CA394464A", raw) || to_hex(raw) != hello.str()) {
      std::cerr << "hex validation is off\n";
      return 1;
    }

    // zero hashes
    if (!Hash::zero().is_zero() || !Hash{}.is_zero() || !Hash{"0000000"}.is_zero() ||
        hello.is_zero()) {
      std::cerr << "zero hash detection is off\n";
      return 1;
    }

    // modes
    if (parse_mode("100644") != Mode::Regular || parse_mode("40000") != Mode::Directory ||
        parse_mode("040000") != Mode::Directory || parse_mode("160000") != Mode::Gitlink) {
      std::cerr << "parse_mode mismatch\n";
      return 1;
    }
    if (format_mode(Mode::Directory) != "040000" || format_mode(Mode::Executable) != "100755") {
      std::cerr << "format_mode mismatch: " << format_mode(Mode::Directory) << "\n";
      return 1;
    }
    if (!throws<InvalidEntry>([] { (void)parse_mode("10064x"); }) ||
        !throws<InvalidEntry>([] { (void)parse_mode(""); })) {
      std::cerr << "bad modes should be rejected\n";
      return 1;
    }
    if (kind_for_mode(Mode::Directory) != ObjectKind::Tree ||
        kind_for_mode(Mode::Gitlink) != ObjectKind::Commit ||
        kind_for_mode(Mode::Symlink) != ObjectKind::Blob) {
      std::cerr << "kind_for_mode mismatch\n";
      return 1;
    }

    // ls-tree records
    const TreeEntry entry{.mode = Mode::Regular,
                          .kind = ObjectKind::Blob,
                          .hash = hello,
                          .name = "name with spaces.txt"};
    const std::string record = format_entry(entry);
    if (record != "100644 blob " + hello.str() + "\tname with spaces.txt") {
      std::cerr << "format_entry: " << record << "\n";
      return 1;
    }
    if (parse_entry(record) != entry) {
      std::cerr << "parse_entry did not restore the entry\n";
      return 1;
    }
    if (!throws<ProtocolError>([] { (void)parse_entry("100644 blob abc"); }) ||
        !throws<ProtocolError>([] { (void)parse_entry("100644 blob\tname"); }) ||
        !throws<ProtocolError>([] { (void)parse_entry("100644 thing abc\tname"); })) {
      std::cerr << "malformed records should be protocol errors\n";
      return 1;
    }

    // paths
    if (pathutil::split_dir("a/b/c") != std::pair<std::string, std::string>{"a/b", "c"} ||
        pathutil::split_dir("c") != std::pair<std::string, std::string>{".", "c"}) {
      std::cerr << "split_dir mismatch\n";
      return 1;
    }
    if (pathutil::parent("a/b") != "a" || pathutil::parent("a") != "." ||
        pathutil::parent(".") != "." || pathutil::depth(".") != 0 ||
        pathutil::depth("a/b/c") != 3) {
      std::cerr << "parent/depth mismatch\n";
      return 1;
    }
    for (const char *bad : {"", "/a", "a/", "a//b", "./a", "a/../b"}) {
      if (!throws<InvalidEntry>([bad] { pathutil::validate(bad); })) {
        std::cerr << "path should be rejected: \"" << bad << "\"\n";
        return 1;
      }
    }
    pathutil::validate("dir/.hidden/file");
    if (strutil::trim(" \t x y \r") != "x y" || strutil::trim("  ") != "" ||
        strutil::chomp("abc\r\n\n") != "abc" || strutil::chomp("\n") != "") {
      std::cerr << "string helpers mismatch\n";
      return 1;
    }

    // tokens, including ones that straddle the reader's internal buffer
    std::string stream;
    std::vector<std::string> expected;
    for (int i = 0; i < 10; ++i) {
      expected.push_back(std::string(5000 + i, static_cast<char>('a' + i)));
      stream += expected.back();
      stream.push_back('\0');
    }
    expected.emplace_back("");
    stream.push_back('\0');
    expected.emplace_back("tail");
    stream += "tail";

    StringSource src{stream};
    TokenReader tokens{src};
    std::vector<std::string> got;
    while (auto tok = tokens.next()) {
      got.push_back(std::move(*tok));
    }
    if (got != expected) {
      std::cerr << "token stream mismatch: got " << got.size() << " tokens\n";
      return 1;
    }

    StringSource lines{"one\ntwo\n"s};
    TokenReader by_line{lines, '\n'};
    if (by_line.next() != "one" || by_line.next() != "two" || by_line.next().has_value()) {
      std::cerr << "newline-delimited tokens mismatch\n";
      return 1;
    }

    // options
    test::TempDir dir{"options"};
    const auto file = dir.path() / "config";
    std::ofstream(file) << "# comment\ngit: /opt/git/bin/git\nlog-level:  debug \n"
                           "conflict-style: zdiff3\nunknown: ignored\n";
    const Options opts = load_options(file);
    if (opts.git_executable != "/opt/git/bin/git" || opts.log_level != "debug" ||
        opts.merge_conflict_style != "zdiff3") {
      std::cerr << "options not loaded: " << opts.git_executable << " " << opts.log_level << "\n";
      return 1;
    }
    const Options defaults = load_options(dir.path() / "missing");
    if (defaults.git_executable != "git" || defaults.log_level != "warn" ||
        !defaults.merge_conflict_style.empty()) {
      std::cerr << "missing config should give defaults\n";
      return 1;
    }

    std::cout << "object model OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
