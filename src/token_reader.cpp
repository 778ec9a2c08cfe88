#include "stackgit/token_reader.hpp"

#include "stackgit/errors.hpp"
#include "stackgit/process.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace stackgit {

auto StringSource::read(std::span<char> buf) -> std::size_t {
  const std::size_t n = std::min(buf.size(), data_.size() - pos_);
  std::memcpy(buf.data(), data_.data() + pos_, n);
  pos_ += n;
  return n;
}

auto ProcessStdout::read(std::span<char> buf) -> std::size_t { return proc_.read_stdout(buf); }

auto TokenReader::fill() -> bool {
  if (eof_) {
    return false;
  }
  // Compact before reading so the buffer does not grow with the stream.
  if (pos_ > 0) {
    buf_.erase(0, pos_);
    pos_ = 0;
  }
  std::array<char, 8192> chunk{};
  const std::size_t n = src_.read(chunk);
  if (n == 0) {
    eof_ = true;
    return false;
  }
  buf_.append(chunk.data(), n);
  return true;
}

auto TokenReader::next() -> std::optional<std::string> {
  std::size_t from = pos_;
  for (;;) {
    const auto end = buf_.find(delim_, from);
    if (end != std::string::npos) {
      std::string tok = buf_.substr(pos_, end - pos_);
      pos_ = end + 1;
      return tok;
    }
    // fill() moves the unread part to the front; skip what was searched.
    const std::size_t searched = buf_.size() - pos_;
    if (!fill()) {
      break;
    }
    from = searched;
  }
  if (pos_ < buf_.size()) {
    if (trailing_ == Trailing::Reject) {
      throw ProtocolError("unterminated token at end of output: \"" + buf_.substr(pos_) + "\"");
    }
    std::string tok = buf_.substr(pos_);
    pos_ = buf_.size();
    return tok;
  }
  return std::nullopt;
}

} // namespace stackgit
