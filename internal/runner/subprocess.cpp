#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fnpipe::runner {

namespace {

using fnpipe::util::RunnerInvocationError;

constexpr int kPollSliceMs      = 50;
constexpr int kTimeoutExitCode  = 124;
constexpr int kCancelExitCode   = 130;
constexpr int kExecFailExitCode = 127;

// Writes to a child that exited early must surface as EPIPE, not kill us.
void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {
  }
  ~Fd() {
    Close();
  }

  Fd(const Fd&)            = delete;
  Fd& operator=(const Fd&) = delete;

  int get() const {
    return fd_;
  }
  bool valid() const {
    return fd_ >= 0;
  }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

void MakePipe(Fd& read_end, Fd& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw RunnerInvocationError(std::string("pipe failed: ") + std::strerror(errno));
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
}

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void AppendLimited(std::string& dst, const char* src, std::size_t n, std::size_t limit, bool& truncated) {
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take  = std::min(n, avail);
  dst.append(src, take);
  if (take < n) {
    truncated = true;
  }
}

int ExitCodeOf(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return ExitCodeOf(status);
}

bool Expired(const ProcessSpec& spec, util::TimePoint started, ProcessResult& result) {
  if (spec.cancellation && spec.cancellation->IsCancelled()) {
    result.cancelled = true;
    return true;
  }
  if (spec.timeout && util::ElapsedMillis(started) >= spec.timeout->count()) {
    result.timed_out = true;
    return true;
  }
  return false;
}

// Reaps the child once its output is drained. A child that closed its
// stdio can keep running, so the deadline and the token still apply.
std::optional<int> ReapWithDeadline(pid_t pid, const ProcessSpec& spec, util::TimePoint started, ProcessResult& result) {
  for (;;) {
    int         status = 0;
    const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
      return ExitCodeOf(status);
    }
    if (reaped < 0 && errno != EINTR) {
      return -1;
    }
    if (Expired(spec, started, result)) {
      return std::nullopt;
    }
    ::poll(nullptr, 0, kPollSliceMs);
  }
}

[[noreturn]] void ExecChild(const ProcessSpec& spec, int stdin_fd, int stdout_fd, int stderr_fd, int error_fd) {
  ::setpgid(0, 0);
  ::signal(SIGPIPE, SIG_DFL);

  ::dup2(stdin_fd, STDIN_FILENO);
  ::dup2(stdout_fd, STDOUT_FILENO);
  ::dup2(stderr_fd, STDERR_FILENO);

  if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
    const int err = errno;
    (void)!::write(error_fd, &err, sizeof(err));
    ::_exit(kExecFailExitCode);
  }

  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  ::execvp(argv[0], argv.data());

  const int err = errno;
  (void)!::write(error_fd, &err, sizeof(err));
  ::_exit(kExecFailExitCode);
}

} // namespace

ProcessResult RunProcess(const ProcessSpec& spec) {
  if (spec.argv.empty() || spec.argv.front().empty()) {
    throw RunnerInvocationError("empty command line");
  }
  IgnoreSigpipe();

  Fd stdin_read, stdin_write, stdout_read, stdout_write, stderr_read, stderr_write, error_read, error_write;
  MakePipe(stdin_read, stdin_write);
  MakePipe(stdout_read, stdout_write);
  MakePipe(stderr_read, stderr_write);
  MakePipe(error_read, error_write);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw RunnerInvocationError(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ExecChild(spec, stdin_read.get(), stdout_write.get(), stderr_write.get(), error_write.get());
  }

  // Either side may call setpgid first; doing it here too closes the race
  // with an early kill(-pid).
  ::setpgid(pid, pid);

  stdin_read.Close();
  stdout_write.Close();
  stderr_write.Close();
  error_write.Close();

  int     exec_errno = 0;
  ssize_t n          = 0;
  do {
    n = ::read(error_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    WaitForChild(pid);
    throw RunnerInvocationError("failed to start '" + spec.argv.front() + "': " + std::strerror(exec_errno));
  }

  SetNonBlocking(stdin_write.get());
  SetNonBlocking(stdout_read.get());
  SetNonBlocking(stderr_read.get());

  if (spec.stdin_data.empty()) {
    stdin_write.Close();
  }

  ProcessResult result;
  std::size_t   written  = 0;
  const auto    started  = util::Now();
  char          buf[65536];

  while (stdout_read.valid() || stderr_read.valid()) {
    if (Expired(spec, started, result)) {
      break;
    }

    pollfd fds[3];
    nfds_t count = 0;
    auto   add   = [&](const Fd& fd, short events) {
      if (fd.valid()) {
        fds[count++] = pollfd{fd.get(), events, 0};
      }
    };
    add(stdin_write, POLLOUT);
    add(stdout_read, POLLIN);
    add(stderr_read, POLLIN);

    const int ready = ::poll(fds, count, kPollSliceMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(-pid, SIGKILL);
      WaitForChild(pid);
      throw RunnerInvocationError(std::string("poll failed: ") + std::strerror(errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      const auto revents = fds[i].revents;
      if (revents == 0) {
        continue;
      }

      if (fds[i].fd == stdin_write.get()) {
        if (revents & (POLLERR | POLLHUP)) {
          stdin_write.Close();
          continue;
        }
        const ssize_t w = ::write(stdin_write.get(), spec.stdin_data.data() + written, spec.stdin_data.size() - written);
        if (w > 0) {
          written += static_cast<std::size_t>(w);
        } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
          stdin_write.Close();
          continue;
        }
        if (written == spec.stdin_data.size()) {
          stdin_write.Close();
        }
        continue;
      }

      const bool is_stdout = fds[i].fd == stdout_read.get();
      Fd&        source    = is_stdout ? stdout_read : stderr_read;
      const ssize_t r      = ::read(source.get(), buf, sizeof(buf));
      if (r > 0) {
        if (is_stdout) {
          result.stdout_text.append(buf, static_cast<std::size_t>(r));
        } else {
          AppendLimited(result.stderr_text, buf, static_cast<std::size_t>(r), spec.max_stderr_bytes, result.stderr_truncated);
        }
      } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
        source.Close();
      }
    }
  }

  std::optional<int> exit_code;
  if (!result.timed_out && !result.cancelled) {
    stdin_write.Close();
    exit_code = ReapWithDeadline(pid, spec, started, result);
  }

  if (!exit_code) {
    ::kill(-pid, SIGKILL);
    WaitForChild(pid);
    result.exit_code = result.timed_out ? kTimeoutExitCode : kCancelExitCode;
    return result;
  }

  result.exit_code = *exit_code;
  if (result.stderr_truncated) {
    result.stderr_text += "(truncated)";
  }
  return result;
}

} // namespace fnpipe::runner
