#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lufscheck {

namespace {

using std::string, std::string_view;
using std::unexpected;

class unique_fd {
  int fd_ = -1;

public:
  unique_fd() = default;
  explicit unique_fd(int fd) noexcept : fd_(fd) {}
  ~unique_fd() { reset(); }

  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;

  unique_fd(unique_fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  unique_fd& operator=(unique_fd&& other) noexcept
  {
    if (this != &other) { reset(); fd_ = std::exchange(other.fd_, -1); }
    return *this;
  }

  [[nodiscard]] int get() const noexcept { return fd_; }

  void reset() noexcept
  {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }
};

[[nodiscard]] std::expected<std::pair<unique_fd, unique_fd>, string> make_pipe()
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    return unexpected(std::format("pipe: {}", std::strerror(errno)));
  return std::pair{unique_fd(fds[0]), unique_fd(fds[1])};
}

[[nodiscard]] int wait_for(pid_t pid)
{
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

std::expected<process_result, string>
run_process(std::vector<string> const &argv, std::chrono::milliseconds timeout)
{
  if (argv.empty()) return unexpected(string("run_process: empty command"));

  auto out_pipe = make_pipe();
  if (!out_pipe) return unexpected(out_pipe.error());
  auto err_pipe = make_pipe();
  if (!err_pipe) return unexpected(err_pipe.error());

  auto &[out_read, out_write] = *out_pipe;
  auto &[err_read, err_write] = *err_pipe;

  // Build the argument vector before forking; the child may only call
  // async-signal-safe functions.
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (auto const &a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) return unexpected(std::format("fork: {}", std::strerror(errno)));

  if (pid == 0) {
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(out_write.get(), STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::execvp(args[0], args.data());
    const int e = errno;
    [[maybe_unused]] auto n = ::write(err_write.get(), &e, sizeof e);
    ::_exit(127);
  }

  out_write.reset();
  err_write.reset();

  // The error pipe is close-on-exec, so it reads EOF once exec succeeded.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_read.get(), &exec_errno, sizeof exec_errno);
  } while (n < 0 && errno == EINTR);
  if (n == sizeof exec_errno) {
    (void)wait_for(pid);
    return unexpected(std::format("cannot run {}: {}", argv[0],
                                  std::strerror(exec_errno)));
  }

  process_result result;
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;
  char buffer[4096];

  for (;;) {
    int wait_ms = -1;
    if (timeout.count() > 0) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now());
      if (left.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left.count(), 60'000));
    }

    pollfd pfd{out_read.get(), POLLIN, 0};
    const int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      (void)wait_for(pid);
      return unexpected(std::format("poll: {}", std::strerror(errno)));
    }
    if (ready == 0) continue;

    const ssize_t got = ::read(out_read.get(), buffer, sizeof buffer);
    if (got < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (got == 0) break;
    result.output.append(buffer, static_cast<size_t>(got));
  }

  if (result.timed_out) ::kill(pid, SIGKILL);
  result.exit_code = wait_for(pid);
  return result;
}

std::optional<std::filesystem::path> find_executable(string_view name)
{
  namespace fs = std::filesystem;

  auto runnable = [](fs::path const &p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
  };

  if (name.empty()) return std::nullopt;
  if (name.find('/') != string_view::npos) {
    fs::path p(name);
    if (runnable(p)) return p;
    return std::nullopt;
  }

  const char *env = std::getenv("PATH");
  string_view search = env ? env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= search.size()) {
    auto end = search.find(':', start);
    if (end == string_view::npos) end = search.size();
    auto dir = search.substr(start, end - start);
    fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
    if (runnable(candidate)) return candidate;
    start = end + 1;
  }
  return std::nullopt;
}

string format_command(std::vector<string> const &argv)
{
  string out;
  for (auto const &a : argv) {
    if (!out.empty()) out += ' ';
    if (!a.empty() && a.find_first_of(" \t\"'\\$;|&<>()") == string::npos) {
      out += a;
      continue;
    }
    out += '\'';
    for (char c : a) {
      if (c == '\'') out += "'\\''";
      else out += c;
    }
    out += '\'';
  }
  return out;
}

} // namespace lufscheck
