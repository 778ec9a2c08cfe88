#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace stackgit {

class Process;

// Something that hands out bytes until it runs dry.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Fill up to buf.size() bytes; 0 means end of stream.
  virtual auto read(std::span<char> buf) -> std::size_t = 0;
};

class StringSource final : public ByteSource {
public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}
  auto read(std::span<char> buf) -> std::size_t override;

private:
  std::string data_;
  std::size_t pos_{0};
};

class ProcessStdout final : public ByteSource {
public:
  explicit ProcessStdout(Process &proc) : proc_(proc) {}
  auto read(std::span<char> buf) -> std::size_t override;

private:
  Process &proc_;
};

// What to do with bytes after the last delimiter.
enum class Trailing : std::uint8_t {
  Keep,   // return them as a final token
  Reject, // throw ProtocolError: the stream was cut off mid-token
};

/**
 * Splits a byte stream into tokens terminated by `delim` (NUL by default).
 *
 * Tokens may contain any other byte. next() yields std::nullopt at end of
 * stream.
 */
class TokenReader {
public:
  explicit TokenReader(ByteSource &src, char delim = '\0', Trailing trailing = Trailing::Keep)
      : src_(src), delim_(delim), trailing_(trailing) {}

  auto next() -> std::optional<std::string>;

private:
  auto fill() -> bool;

  ByteSource &src_;
  char delim_;
  Trailing trailing_;
  std::string buf_;
  std::size_t pos_{0};
  bool eof_{false};
};

} // namespace stackgit
