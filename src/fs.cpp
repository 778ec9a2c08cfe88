#include "stackgit/fs.hpp"

#include "stackgit/errors.hpp"
#include "stackgit/process.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>
#include <zlib.h>

namespace stackgit::fs {

namespace {

auto io_error(const std::string &what, const std::filesystem::path &p, int err) -> StoreIOError {
  return StoreIOError(what + " " + p.string() + ": " + std::strerror(err));
}

void write_all(int fd, std::span<const std::uint8_t> data, const std::filesystem::path &p) {
  while (!data.empty()) {
    const ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw io_error("write", p, errno);
    }
    data = data.subspan(static_cast<std::size_t>(n));
  }
}

// Owns a z_stream for deflate or inflate.
class ZStream {
public:
  enum class Kind { Deflate, Inflate };

  explicit ZStream(Kind kind) : kind_(kind) {
    const int rc = kind == Kind::Deflate ? deflateInit(&zs_, Z_BEST_SPEED) : inflateInit(&zs_);
    if (rc != Z_OK) {
      throw StoreIOError("zlib init failed");
    }
  }
  ~ZStream() {
    if (kind_ == Kind::Deflate)
      deflateEnd(&zs_);
    else
      inflateEnd(&zs_);
  }
  ZStream(const ZStream &) = delete;
  ZStream &operator=(const ZStream &) = delete;

  void input(std::span<const std::uint8_t> data) {
    zs_.next_in = const_cast<Bytef *>(data.data());
    zs_.avail_in = static_cast<uInt>(data.size());
  }
  [[nodiscard]] auto pending_input() const -> bool { return zs_.avail_in != 0; }

  // Run one step writing into `out`; returns the zlib status.
  auto step(std::vector<std::uint8_t> &out, int flush) -> int {
    std::array<std::uint8_t, 16384> chunk{};
    zs_.next_out = chunk.data();
    zs_.avail_out = static_cast<uInt>(chunk.size());
    const int rc = kind_ == Kind::Deflate ? ::deflate(&zs_, flush) : ::inflate(&zs_, flush);
    out.insert(out.end(), chunk.begin(), chunk.end() - zs_.avail_out);
    last_produced_ = chunk.size() - zs_.avail_out;
    return rc;
  }
  [[nodiscard]] auto last_produced() const -> std::size_t { return last_produced_; }

private:
  Kind kind_;
  z_stream zs_{};
  std::size_t last_produced_{0};
};

} // namespace

auto read_file(const std::filesystem::path &p) -> std::vector<std::uint8_t> {
  const UniqueFd fd{::open(p.c_str(), O_RDONLY | O_CLOEXEC)};
  if (!fd) {
    throw io_error("open", p, errno);
  }
  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 16384> buf{};
  for (;;) {
    const ssize_t n = ::read(fd.get(), buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw io_error("read", p, errno);
    }
    if (n == 0)
      break;
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  return out;
}

void publish_file(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    throw StoreIOError("create " + p.parent_path().string() + ": " + ec.message());
  }

  static std::atomic<unsigned> counter{0};
  std::filesystem::path tmp = p;
  tmp += ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter++);
  {
    const UniqueFd fd{::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0444)};
    if (!fd) {
      throw io_error("create", tmp, errno);
    }
    try {
      write_all(fd.get(), data, tmp);
    } catch (const StoreIOError &) {
      ::unlink(tmp.c_str());
      throw;
    }
  }

  // link() refuses to replace, so an object that appeared meanwhile wins.
  const int rc = ::link(tmp.c_str(), p.c_str());
  const int err = errno;
  ::unlink(tmp.c_str());
  if (rc != 0 && err != EEXIST) {
    throw io_error("link", p, err);
  }
}

auto deflate(std::span<const std::span<const std::uint8_t>> parts) -> std::vector<std::uint8_t> {
  ZStream z{ZStream::Kind::Deflate};
  std::vector<std::uint8_t> out;
  for (const auto part : parts) {
    z.input(part);
    while (z.pending_input()) {
      if (z.step(out, Z_NO_FLUSH) != Z_OK) {
        throw StoreIOError("zlib deflate failed");
      }
    }
  }
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    rc = z.step(out, Z_FINISH);
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
      throw StoreIOError("zlib deflate failed");
    }
  }
  return out;
}

auto inflate(std::span<const std::uint8_t> data) -> std::vector<std::uint8_t> {
  ZStream z{ZStream::Kind::Inflate};
  z.input(data);
  std::vector<std::uint8_t> out;
  for (;;) {
    const int rc = z.step(out, Z_NO_FLUSH);
    if (rc == Z_STREAM_END) {
      return out;
    }
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
      throw ProtocolError("corrupt zlib stream");
    }
    if (z.last_produced() == 0 && !z.pending_input()) {
      throw ProtocolError("truncated zlib stream");
    }
  }
}

} // namespace stackgit::fs
