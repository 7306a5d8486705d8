// Repository: Rewind
// Component: POSIX Process Gateway
// Purpose: fork/exec child supervision with pipe capture, cancel and timeout.
// Copyright (c) 2026 Rewind

#include "rewind/process/PosixProcessGateway.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rwd::process {

namespace {

using Clock = std::chrono::steady_clock;

// Captured output keeps only the tail; ffmpeg can be chatty on long merges.
constexpr size_t kMaxCapturedBytes = 256 * 1024;
constexpr int kPollIntervalMs = 50;
constexpr int kMaxInheritedFd = 1024;

bool IsExecutableFile(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}

void AppendCapped(std::string* out, const char* data, size_t n) {
  out->append(data, n);
  if (out->size() > kMaxCapturedBytes) {
    out->erase(0, out->size() - kMaxCapturedBytes);
  }
}

// Reads everything currently available from a non-blocking fd.
// Returns false once the fd hit EOF or a hard error (caller closes it).
bool DrainFd(int fd, std::string* out) {
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      AppendCapped(out, buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
}

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

void ClosePipe(int fds[2]) {
  CloseFd(&fds[0]);
  CloseFd(&fds[1]);
}

std::string ErrnoText(int err) {
  return std::string(std::strerror(err));
}

}  // namespace

std::string ProcessResult::Describe() const {
  std::ostringstream o;
  if (term_signal != 0) {
    o << "signal=" << term_signal;
  } else {
    o << "exit=" << exit_code;
  }
  if (cancelled) o << " (cancelled)";
  if (timed_out) o << " (timed out)";
  return o.str();
}

void ThrowIfFailed(const ProcessResult& result, ErrorCode code,
                   const std::string& message) {
  if (result.Ok()) return;
  throw RewindError(code, message + " [" + result.Describe() + "]",
                    result.stderr_text);
}

// -----------------------------------------------------------------------------
// PosixProcessHandle
// -----------------------------------------------------------------------------

class PosixProcessHandle : public IProcessHandle {
 public:
  PosixProcessHandle(pid_t pid, int stdout_fd, int stderr_fd,
                     const LaunchSpec& spec)
      : pid_(pid),
        stdout_fd_(stdout_fd),
        stderr_fd_(stderr_fd),
        label_(spec.label) {
    if (spec.timeout) {
      deadline_ = Clock::now() + *spec.timeout;
    }
    waiter_ = std::thread(&PosixProcessHandle::WaiterLoop, this);
  }

  ~PosixProcessHandle() override {
    Cancel();
    if (waiter_.joinable()) waiter_.join();
  }

  PosixProcessHandle(const PosixProcessHandle&) = delete;
  PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

  void Cancel() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_ || cancel_requested_) return;
    cancel_requested_ = true;
    util::Logger::Debug("[ProcessGateway] cancel label=" + label_ +
                        " pid=" + std::to_string(pid_));
    SignalLocked(SIGINT);
    ArmKillLocked();
  }

  ProcessResult Wait() override {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return exited_; });
    return result_;
  }

  bool Finished() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
  }

 private:
  // Requires mutex_ held. The child is not reaped while exited_ is false,
  // so pid_ still names our child (possibly a zombie) and its process group.
  // The whole group is signalled so shell wrappers take their children down.
  void SignalLocked(int sig) {
    if (exited_) return;
    if (kill(-pid_, sig) != 0 && errno != ESRCH) {
      util::Logger::Warn("[ProcessGateway] kill(" + std::to_string(pid_) + ", " +
                         std::to_string(sig) + ") failed: " + ErrnoText(errno));
    }
  }

  void ArmKillLocked() {
    const auto at = Clock::now() + std::chrono::milliseconds(
                                       PosixProcessGateway::kKillGraceMs);
    if (!kill_at_ || at < *kill_at_) kill_at_ = at;
  }

  void WaiterLoop() {
    std::string out_text;
    std::string err_text;

    while (true) {
      struct pollfd fds[2];
      nfds_t nfds = 0;
      if (stdout_fd_ >= 0) fds[nfds++] = {stdout_fd_, POLLIN, 0};
      if (stderr_fd_ >= 0) fds[nfds++] = {stderr_fd_, POLLIN, 0};

      int ready = poll(nfds > 0 ? fds : nullptr, nfds, kPollIntervalMs);
      if (ready > 0) {
        for (nfds_t i = 0; i < nfds; ++i) {
          if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
          const bool is_stdout = (fds[i].fd == stdout_fd_);
          int* fd = is_stdout ? &stdout_fd_ : &stderr_fd_;
          if (!DrainFd(*fd, is_stdout ? &out_text : &err_text)) {
            CloseFd(fd);
          }
        }
      }

      // Observe exit without reaping; reaping happens under the mutex below.
      siginfo_t info;
      std::memset(&info, 0, sizeof(info));
      int wr = waitid(P_PID, static_cast<id_t>(pid_), &info,
                      WEXITED | WNOHANG | WNOWAIT);
      if (wr == 0 && info.si_pid == pid_) break;
      if (wr != 0 && errno != EINTR) {
        util::Logger::Warn("[ProcessGateway] waitid failed label=" + label_ +
                           " pid=" + std::to_string(pid_) + ": " + ErrnoText(errno));
        break;
      }

      std::lock_guard<std::mutex> lock(mutex_);
      const auto now = Clock::now();
      if (deadline_ && !timed_out_ && now >= *deadline_) {
        timed_out_ = true;
        util::Logger::Warn("[ProcessGateway] timeout label=" + label_ +
                           " pid=" + std::to_string(pid_) + ", terminating");
        SignalLocked(SIGINT);
        ArmKillLocked();
      }
      if (kill_at_ && now >= *kill_at_) {
        util::Logger::Warn("[ProcessGateway] escalating to SIGKILL label=" +
                           label_ + " pid=" + std::to_string(pid_));
        SignalLocked(SIGKILL);
        kill_at_.reset();
      }
    }

    // Whatever the child wrote before exiting is still in the pipes.
    if (stdout_fd_ >= 0) {
      DrainFd(stdout_fd_, &out_text);
      CloseFd(&stdout_fd_);
    }
    if (stderr_fd_ >= 0) {
      DrainFd(stderr_fd_, &err_text);
      CloseFd(&stderr_fd_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    pid_t reaped;
    do {
      reaped = waitpid(pid_, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
      if (WIFEXITED(status)) {
        result_.exit_code = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        result_.term_signal = WTERMSIG(status);
      }
    }
    result_.cancelled = cancel_requested_;
    result_.timed_out = timed_out_;
    result_.stdout_text = std::move(out_text);
    result_.stderr_text = std::move(err_text);
    exited_ = true;
    util::Logger::Debug("[ProcessGateway] reaped label=" + label_ + " pid=" +
                        std::to_string(pid_) + " " + result_.Describe());
    done_cv_.notify_all();
  }

  const pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;
  const std::string label_;
  std::optional<Clock::time_point> deadline_;

  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  bool exited_ = false;
  bool cancel_requested_ = false;
  bool timed_out_ = false;
  std::optional<Clock::time_point> kill_at_;
  ProcessResult result_;

  std::thread waiter_;
};

// -----------------------------------------------------------------------------
// PosixProcessGateway
// -----------------------------------------------------------------------------

PosixProcessGateway::PosixProcessGateway(std::vector<std::string> extra_search_dirs)
    : extra_search_dirs_(std::move(extra_search_dirs)) {}

std::optional<std::string> PosixProcessGateway::ResolveExecutable(
    const std::string& name) const {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name)) return name;
    return std::nullopt;
  }

  for (const auto& dir : extra_search_dirs_) {
    std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) return candidate;
  }

  const char* path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) return candidate;
  }
  return std::nullopt;
}

std::shared_ptr<IProcessHandle> PosixProcessGateway::Launch(const LaunchSpec& spec) {
  auto resolved = ResolveExecutable(spec.executable);
  if (!resolved) {
    throw RewindError(spec.missing_executable_error,
                      spec.label + " executable not found: " + spec.executable);
  }

  // argv is built before fork: the child may only call async-signal-safe
  // functions.
  std::vector<std::string> argv_str;
  argv_str.reserve(spec.args.size() + 1);
  argv_str.push_back(*resolved);
  argv_str.insert(argv_str.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  argv.reserve(argv_str.size() + 1);
  for (auto& s : argv_str) argv.push_back(&s[0]);
  argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    throw RewindError(ErrorCode::kProcessLaunchFailed,
                      spec.label + ": pipe() failed: " + ErrnoText(err));
  }

  pid_t pid = fork();
  if (pid == -1) {
    const int err = errno;
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    throw RewindError(ErrorCode::kProcessLaunchFailed,
                      spec.label + ": fork() failed: " + ErrnoText(err));
  }

  if (pid == 0) {
    // Child process. Own process group: terminal signals aimed at the daemon
    // must not reach the capture process behind the recorder's back.
    setpgid(0, 0);

    // Ignored dispositions survive exec; the child gets the defaults so
    // Cancel()'s SIGINT reaches it.
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(spec.capture_stdout ? out_pipe[1] : devnull, STDOUT_FILENO);
    dup2(spec.capture_stderr ? err_pipe[1] : devnull, STDERR_FILENO);

    // Close file descriptors to avoid sharing with parent process.
    for (int fd = 3; fd < kMaxInheritedFd; ++fd) {
      if (fd != exec_pipe[1]) close(fd);
    }

    execv(argv[0], argv.data());

    // If execv returns, it failed: report errno through the CLOEXEC pipe.
    int exec_errno = errno;
    ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  // Parent process.
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    const ErrorCode code = (exec_errno == ENOENT || exec_errno == EACCES)
                               ? spec.missing_executable_error
                               : ErrorCode::kProcessLaunchFailed;
    throw RewindError(code, spec.label + ": exec " + *resolved +
                                " failed: " + ErrnoText(exec_errno));
  }

  if (!spec.capture_stdout) CloseFd(&out_pipe[0]);
  if (!spec.capture_stderr) CloseFd(&err_pipe[0]);
  for (int fd : {out_pipe[0], err_pipe[0]}) {
    if (fd >= 0) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
  }

  util::Logger::Debug("[ProcessGateway] launched label=" + spec.label +
                      " pid=" + std::to_string(pid) + " exe=" + *resolved);
  try {
    return std::make_shared<PosixProcessHandle>(pid, out_pipe[0], err_pipe[0], spec);
  } catch (const std::exception& e) {
    // No handle owns the child yet: kill and reap it here.
    kill(-pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw RewindError(ErrorCode::kProcessLaunchFailed,
                      spec.label + ": supervising pid " + std::to_string(pid) +
                          " failed: " + e.what());
  }
}

}  // namespace rwd::process
