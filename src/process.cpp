#include "stackgit/process.hpp"

#include "stackgit/errors.hpp"
#include "stackgit/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace stackgit {

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    // best effort; no throw in destructor
    ::close(fd_);
    fd_ = -1;
  }
}

namespace {

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

[[nodiscard]] auto errno_message(std::string_view what, int err) -> std::string {
  std::string msg(what);
  msg += ": ";
  msg += std::strerror(err);
  return msg;
}

[[nodiscard]] auto make_pipe() -> Pipe {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    throw StoreIOError(errno_message("pipe", errno));
  }
  return Pipe{.read = UniqueFd{fds[0]}, .write = UniqueFd{fds[1]}};
}

// Writes to a child that already exited must fail with EPIPE
// instead of killing us.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Inherited environment with `extra` (KEY=VALUE) replacing matching keys.
[[nodiscard]] auto build_env(const std::vector<std::string> &extra) -> std::vector<std::string> {
  std::vector<std::string> env;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string_view entry{*e};
    const std::string_view key = entry.substr(0, entry.find('=') + 1);
    const bool overridden = std::ranges::any_of(
        extra, [&](const std::string &x) { return x.starts_with(key); });
    if (!overridden) {
      env.emplace_back(entry);
    }
  }
  env.insert(env.end(), extra.begin(), extra.end());
  return env;
}

[[nodiscard]] auto to_cstrings(std::vector<std::string> &strings) -> std::vector<char *> {
  std::vector<char *> out;
  out.reserve(strings.size() + 1);
  for (auto &s : strings) {
    out.push_back(s.data());
  }
  out.push_back(nullptr);
  return out;
}

} // namespace

Process::Process(const ProcessOptions &opts, std::stop_token stop) : stop_(std::move(stop)) {
  ignore_sigpipe();

  name_ = opts.executable.filename().string();
  if (!opts.args.empty()) {
    name_ += " " + opts.args.front();
  }
  if (stop_.stop_requested()) {
    throw Cancelled();
  }

  // Everything the child needs is prepared before fork(): after it, the
  // child only makes async-signal-safe calls.
  std::vector<std::string> argv_store{opts.executable.string()};
  argv_store.insert(argv_store.end(), opts.args.begin(), opts.args.end());
  std::vector<std::string> env_store = build_env(opts.env);
  auto argv = to_cstrings(argv_store);
  auto envp = to_cstrings(env_store);
  const std::string work_dir = opts.work_dir.string();

  if (auto logger = log::get(); logger->should_log(spdlog::level::debug)) {
    std::string line;
    for (const auto &a : argv_store) {
      line += line.empty() ? "" : " ";
      line += a;
    }
    logger->debug("run: {}{}", line, work_dir.empty() ? "" : " (in " + work_dir + ")");
  }

  Pipe in = make_pipe();
  Pipe out = make_pipe();
  Pipe err = make_pipe();
  Pipe exec_status = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw StoreIOError(errno_message("fork", errno));
  }
  if (pid == 0) {
    ::dup2(in.read.get(), STDIN_FILENO);
    ::dup2(out.write.get(), STDOUT_FILENO);
    ::dup2(err.write.get(), STDERR_FILENO);
    int child_errno = 0;
    if (!work_dir.empty() && ::chdir(work_dir.c_str()) != 0) {
      child_errno = errno;
    } else {
      ::execvpe(argv[0], argv.data(), envp.data());
      child_errno = errno;
    }
    [[maybe_unused]] const auto n =
        ::write(exec_status.write.get(), &child_errno, sizeof child_errno);
    ::_exit(127);
  }
  pid_ = pid;

  // The status pipe is close-on-exec: EOF means exec succeeded.
  exec_status.write.reset();
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_status.read.get(), &child_errno, sizeof child_errno);
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof child_errno)) {
    reap();
    throw StoreIOError(errno_message("start " + argv_store.front(), child_errno));
  }

  stdin_ = std::move(in.write);
  stdout_ = std::move(out.read);
  UniqueFd err_read = std::move(err.read);
  err.write.reset();
  out.write.reset();
  in.read.reset();

  on_stop_ = std::make_unique<std::stop_callback<std::function<void()>>>(
      stop_, std::function<void()>([this] { kill(); }));

  stderr_reader_ = std::thread([this, fd = std::move(err_read)] {
    std::array<char, 4096> buf{};
    std::string pending;
    auto logger = log::get();
    for (;;) {
      const ssize_t got = ::read(fd.get(), buf.data(), buf.size());
      if (got < 0 && errno == EINTR) {
        continue;
      }
      if (got <= 0) {
        break;
      }
      {
        const std::lock_guard lock(stderr_mu_);
        stderr_buf_.append(buf.data(), static_cast<std::size_t>(got));
      }
      pending.append(buf.data(), static_cast<std::size_t>(got));
      for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n')) {
        logger->debug("{}: {}", name_, pending.substr(0, nl));
        pending.erase(0, nl + 1);
      }
    }
    if (!pending.empty()) {
      logger->debug("{}: {}", name_, pending);
    }
  });
}

Process::~Process() {
  if (!reaped_) {
    kill();
  }
  on_stop_.reset();
  stdin_.reset();
  if (stdin_writer_.joinable()) {
    stdin_writer_.join();
  }
  stdout_.reset();
  reap();
  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }
}

void Process::feed_stdin(std::string input) {
  if (!stdin_ || stdin_writer_.joinable()) {
    throw StoreIOError(name_ + ": stdin already closed");
  }
  stdin_writer_ = std::thread([this, fd = std::move(stdin_), data = std::move(input)] {
    std::string_view rest{data};
    while (!rest.empty()) {
      const ssize_t n = ::write(fd.get(), rest.data(), rest.size());
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        stdin_error_ = errno_message("write stdin", errno);
        return;
      }
      rest.remove_prefix(static_cast<std::size_t>(n));
    }
  });
}

void Process::close_stdin() noexcept { stdin_.reset(); }

auto Process::read_stdout(std::span<char> buf) -> std::size_t {
  if (!stdout_) {
    return 0;
  }
  for (;;) {
    const ssize_t n = ::read(stdout_.get(), buf.data(), buf.size());
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno != EINTR) {
      throw StoreIOError(errno_message(name_ + ": read stdout", errno));
    }
  }
}

auto Process::read_all_stdout() -> std::string {
  std::string out;
  std::array<char, 8192> buf{};
  for (;;) {
    const std::size_t n = read_stdout(buf);
    if (n == 0) {
      break;
    }
    out.append(buf.data(), n);
  }
  return out;
}

void Process::drain_stdout() noexcept {
  if (!stdout_) {
    return;
  }
  std::array<char, 8192> buf{};
  for (;;) {
    const ssize_t n = ::read(stdout_.get(), buf.data(), buf.size());
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
  }
  stdout_.reset();
}

auto Process::wait() -> int {
  close_stdin();
  if (stdin_writer_.joinable()) {
    stdin_writer_.join();
  }
  if (!reaped_) {
    // Wait for the exit without reaping, so that the stop callback still
    // signals our child and never a recycled pid.
    siginfo_t info{};
    while (::waitid(P_PID, pid_, &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
    }
    on_stop_.reset();
    reap();
  }
  if (stderr_reader_.joinable()) {
    stderr_reader_.join();
  }
  if (exit_code_ == 0 && !stdin_error_.empty()) {
    throw StoreIOError(name_ + ": " + stdin_error_);
  }
  return exit_code_;
}

void Process::kill() noexcept {
  const std::lock_guard lock(mu_);
  if (!reaped_ && pid_ > 0) {
    ::kill(pid_, SIGKILL);
  }
}

void Process::reap() noexcept {
  const std::lock_guard lock(mu_);
  if (reaped_ || pid_ <= 0) {
    return;
  }
  int status = 0;
  pid_t r = 0;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  reaped_ = true;
  if (r < 0) {
    exit_code_ = -1;
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
}

auto Process::stderr_text() const -> std::string {
  const std::lock_guard lock(stderr_mu_);
  return stderr_buf_;
}

auto exit_message(std::string_view what, int exit_code, std::string_view stderr_text)
    -> std::string {
  std::string msg(what);
  msg += " exited with status " + std::to_string(exit_code);
  while (!stderr_text.empty() && std::isspace(static_cast<unsigned char>(stderr_text.back()))) {
    stderr_text.remove_suffix(1);
  }
  while (!stderr_text.empty() && std::isspace(static_cast<unsigned char>(stderr_text.front()))) {
    stderr_text.remove_prefix(1);
  }
  if (!stderr_text.empty()) {
    msg += ": ";
    msg += stderr_text;
  }
  return msg;
}

auto run_command(const ProcessOptions &opts, std::string input, std::stop_token stop)
    -> CommandResult {
  Process proc{opts, stop};
  if (input.empty()) {
    proc.close_stdin();
  } else {
    proc.feed_stdin(std::move(input));
  }

  CommandResult res;
  res.out = proc.read_all_stdout();
  res.exit_code = proc.wait();
  if (proc.stop_requested()) {
    throw Cancelled();
  }
  res.err = proc.stderr_text();
  return res;
}

} // namespace stackgit
