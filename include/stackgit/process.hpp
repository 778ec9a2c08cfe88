#pragma once
#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace stackgit {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept;
};

struct ProcessOptions {
  std::filesystem::path executable;
  std::vector<std::string> args;  // argv[1..]
  std::filesystem::path work_dir; // empty: inherit
  std::vector<std::string> env;   // extra KEY=VALUE entries
};

/**
 * A child process with piped stdin, stdout and stderr.
 *
 * stderr is drained on a background thread (and logged at debug level) so
 * the child never blocks on it. Input handed to feed_stdin() is written on a
 * second thread, leaving the caller free to consume stdout at the same time.
 *
 * A stop request on `stop` kills the child with SIGKILL. The process is
 * reaped by wait(), or by the destructor if wait() was never called.
 */
class Process {
public:
  Process(const ProcessOptions &opts, std::stop_token stop);
  ~Process();

  Process(const Process &) = delete;
  auto operator=(const Process &) -> Process & = delete;

  // Write `input` to stdin on a background thread, then close stdin.
  void feed_stdin(std::string input);
  void close_stdin() noexcept;

  // Read up to buf.size() bytes of stdout. Returns 0 at end of stream.
  // Throws StoreIOError on read failure.
  auto read_stdout(std::span<char> buf) -> std::size_t;

  // Read the rest of stdout.
  auto read_all_stdout() -> std::string;

  // Discard whatever is left on stdout.
  void drain_stdout() noexcept;

  // Wait for exit and return the exit code (128 + signal number for a
  // signalled child). Idempotent.
  auto wait() -> int;

  // SIGKILL the child unless it has been reaped already.
  void kill() noexcept;

  [[nodiscard]] auto stop_requested() const noexcept -> bool { return stop_.stop_requested(); }
  [[nodiscard]] auto stderr_text() const -> std::string;
  [[nodiscard]] auto name() const noexcept -> const std::string & { return name_; }

private:
  void reap() noexcept;

  std::string name_;
  std::stop_token stop_;

  mutable std::mutex mu_; // guards pid_/reaped_ against the stop callback
  pid_t pid_{-1};
  bool reaped_{false};
  int exit_code_{-1};

  UniqueFd stdin_;
  UniqueFd stdout_;

  std::string stdin_error_;
  std::thread stdin_writer_;

  mutable std::mutex stderr_mu_;
  std::string stderr_buf_;
  std::thread stderr_reader_;

  std::unique_ptr<std::stop_callback<std::function<void()>>> on_stop_;
};

struct CommandResult {
  int exit_code{0};
  std::string out;
  std::string err;
};

// "<what> exited with status <code>: <stderr>", with stderr trimmed.
auto exit_message(std::string_view what, int exit_code, std::string_view stderr_text)
    -> std::string;

// Run a command to completion, feeding `input` on stdin.
// Throws Cancelled if `stop` fires, StoreIOError if the command cannot run.
// A non-zero exit code is reported, not thrown.
auto run_command(const ProcessOptions &opts, std::string input = {},
                 std::stop_token stop = {}) -> CommandResult;

} // namespace stackgit
