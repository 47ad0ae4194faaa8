#include "process_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

extern char** environ;

namespace homefin {
namespace {

constexpr size_t kMaxStderrTail = 4096;
constexpr int kPollSliceMs = 50;

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

static void SetNonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return;
  static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    static_cast<void>(close(*fd));
    *fd = -1;
  }
}

static void ClosePair(int fds[2]) {
  CloseFd(&fds[0]);
  CloseFd(&fds[1]);
}

static bool IsExecutableFile(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}

static bool IsRegularFile(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

static std::string LookupEnv(const LaunchSpec& spec, const std::string& key) {
  for (const auto& kv : spec.env) {
    if (kv.first == key) return kv.second;
  }
  const char* v = std::getenv(key.c_str());
  return v ? std::string(v) : std::string();
}

// Mirrors execvp's search so missing binaries are reported before fork.
static std::optional<std::string> ResolveExecutable(const LaunchSpec& spec) {
  const std::string& name = spec.command.front();
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    std::filesystem::path p(name);
    if (p.is_relative() && !spec.working_directory.empty()) p = std::filesystem::path(spec.working_directory) / p;
    // Existing but non-executable files are left for exec to reject.
    if (!IsRegularFile(p.string())) return std::nullopt;
    return p.string();
  }
  std::string path_env = LookupEnv(spec, "PATH");
  if (path_env.empty()) path_env = "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path_env.size()) {
    size_t colon = path_env.find(':', start);
    if (colon == std::string::npos) colon = path_env.size();
    std::string dir = path_env.substr(start, colon - start);
    if (dir.empty()) dir = ".";
    auto candidate = (std::filesystem::path(dir) / name).string();
    if (IsExecutableFile(candidate)) return candidate;
    start = colon + 1;
  }
  return std::nullopt;
}

static std::vector<std::string> BuildEnvironment(const LaunchSpec& spec) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    const std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
    bool dropped = false;
    for (const auto& prefix : spec.drop_env_prefixes) {
      if (!prefix.empty() && key.compare(0, prefix.size(), prefix) == 0) dropped = true;
    }
    if (dropped) continue;
    bool overridden = false;
    for (const auto& kv : spec.env) {
      if (kv.first == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) out.push_back(std::move(entry));
  }
  for (const auto& kv : spec.env) out.push_back(kv.first + "=" + kv.second);
  return out;
}

static std::vector<char*> ToCStrings(std::vector<std::string>& items) {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (auto& s : items) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

static std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
  return "unknown status";
}

}  // namespace

ProcessTransport::~ProcessTransport() {
  Terminate(std::chrono::milliseconds(1000));
}

bool ProcessTransport::Start(const LaunchSpec& spec, ToolError* err) {
  if (pid_ > 0) {
    SetToolError(err, ToolErrorKind::kInvalidState, "process already started");
    return false;
  }
  if (spec.command.empty() || spec.command.front().empty()) {
    SetToolError(err, ToolErrorKind::kPathResolution, "tool server command is empty");
    return false;
  }
  if (!spec.working_directory.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(spec.working_directory, ec) || ec) {
      SetToolError(err, ToolErrorKind::kPathResolution,
                   "working directory does not exist: " + spec.working_directory);
      return false;
    }
  }
  auto resolved = ResolveExecutable(spec);
  if (!resolved) {
    SetToolError(err, ToolErrorKind::kPathResolution, "cannot locate executable: " + spec.command.front());
    return false;
  }

  IgnoreSigpipeOnce();

  // Everything the child touches is prepared before fork.
  std::vector<std::string> argv_storage = spec.command;
  argv_storage[0] = *resolved;
  std::vector<std::string> env_storage = BuildEnvironment(spec);
  auto argv = ToCStrings(argv_storage);
  auto envp = ToCStrings(env_storage);
  const std::string cwd = spec.working_directory;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    const int saved = errno;
    ClosePair(in_pipe);
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    ClosePair(status_pipe);
    SetToolError(err, ToolErrorKind::kSpawn, std::string("failed to create pipes: ") + std::strerror(saved));
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    ClosePair(in_pipe);
    ClosePair(out_pipe);
    ClosePair(err_pipe);
    ClosePair(status_pipe);
    SetToolError(err, ToolErrorKind::kSpawn, std::string("fork failed: ") + std::strerror(saved));
    return false;
  }

  if (pid == 0) {
    int child_errno = 0;
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      child_errno = errno;
    } else if (dup2(in_pipe[0], STDIN_FILENO) < 0 || dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
               dup2(err_pipe[1], STDERR_FILENO) < 0) {
      child_errno = errno;
    } else {
      execve(argv[0], argv.data(), envp.data());
      child_errno = errno;
    }
    ssize_t ignored = write(status_pipe[1], &child_errno, sizeof(child_errno));
    static_cast<void>(ignored);
    _exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&status_pipe[1]);

  // EOF means exec succeeded (the write end was close-on-exec).
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);
  if (n > 0) {
    int status = 0;
    static_cast<void>(waitpid(pid, &status, 0));
    CloseFd(&in_pipe[1]);
    CloseFd(&out_pipe[0]);
    CloseFd(&err_pipe[0]);
    SetToolError(err, ToolErrorKind::kSpawn,
                 "failed to exec " + spec.command.front() + ": " + std::strerror(child_errno));
    return false;
  }

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  exited_ = false;
  exit_status_ = 0;
  stdout_buf_.clear();
  stderr_tail_.clear();
  SetNonblocking(stdin_fd_);
  SetNonblocking(stdout_fd_);
  SetNonblocking(stderr_fd_);
  return true;
}

bool ProcessTransport::WriteLine(const std::string& text, ToolError* err, std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const bool bounded = timeout.count() > 0;
  const auto deadline = Clock::now() + timeout;

  if (pid_ <= 0 || stdin_fd_ < 0) {
    SetToolError(err, ToolErrorKind::kWrite, "tool server stdin is closed");
    return false;
  }
  if (ReapIfExited()) {
    DrainStderr();
    SetToolError(err, ToolErrorKind::kWrite, "tool server has exited (" + ExitDiagnostic() + ")");
    return false;
  }
  std::string data = text;
  data.push_back('\n');
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(stdin_fd_, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // Pipe is full: the child is not reading.
      if (cancel_token_ && cancel_token_->load()) {
        SetToolError(err, ToolErrorKind::kCancelled, "write cancelled");
        return false;
      }
      int wait_ms = kPollSliceMs;
      if (bounded) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
          SetToolError(err, ToolErrorKind::kTimeout,
                       "timed out after " + std::to_string(timeout.count()) + "ms writing to tool server");
          return false;
        }
        if (remaining < wait_ms) wait_ms = static_cast<int>(remaining);
      }
      pollfd pfd{};
      pfd.fd = stdin_fd_;
      pfd.events = POLLOUT;
      const int pr = poll(&pfd, 1, wait_ms);
      if (pr < 0 && errno != EINTR) {
        const int saved = errno;
        SetToolError(err, ToolErrorKind::kWrite, std::string("poll on tool server stdin failed: ") + std::strerror(saved));
        return false;
      }
      // Keep stderr moving so a child blocked on it can get back to reading stdin.
      DrainStderr();
      continue;
    }
    const int saved = errno;
    CloseFd(&stdin_fd_);
    for (int i = 0; i < 10 && !ReapIfExited(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    DrainStderr();
    SetToolError(err, ToolErrorKind::kWrite,
                 std::string("write to tool server failed: ") + std::strerror(saved) + " (" + ExitDiagnostic() + ")");
    return false;
  }
  return true;
}

std::optional<std::string> ProcessTransport::ReadLine(std::chrono::milliseconds timeout, ToolError* err) {
  using Clock = std::chrono::steady_clock;
  const bool bounded = timeout.count() > 0;
  const auto deadline = Clock::now() + timeout;

  while (true) {
    auto nl = stdout_buf_.find('\n');
    if (nl != std::string::npos) {
      std::string line = stdout_buf_.substr(0, nl);
      stdout_buf_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      return line;
    }
    if (cancel_token_ && cancel_token_->load()) {
      SetToolError(err, ToolErrorKind::kCancelled, "read cancelled");
      return std::nullopt;
    }
    if (stdout_fd_ < 0) {
      // Give the child a moment to finish so the diagnostic has an exit status.
      for (int i = 0; i < 10 && !ReapIfExited(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      DrainStderr();
      SetToolError(err, ToolErrorKind::kUnexpectedExit, "tool server closed stdout (" + ExitDiagnostic() + ")");
      return std::nullopt;
    }

    int wait_ms = kPollSliceMs;
    if (bounded) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
      if (remaining <= 0) {
        SetToolError(err, ToolErrorKind::kTimeout,
                     "timed out after " + std::to_string(timeout.count()) + "ms waiting for tool server output");
        return std::nullopt;
      }
      if (remaining < wait_ms) wait_ms = static_cast<int>(remaining);
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    fds[nfds].fd = stdout_fd_;
    fds[nfds].events = POLLIN;
    ++nfds;
    if (stderr_fd_ >= 0) {
      fds[nfds].fd = stderr_fd_;
      fds[nfds].events = POLLIN;
      ++nfds;
    }
    static_cast<void>(poll(fds, nfds, wait_ms));
    DrainStderr();

    bool got_data = false;
    char buffer[4096];
    while (stdout_fd_ >= 0) {
      const ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
      if (n > 0) {
        stdout_buf_.append(buffer, static_cast<size_t>(n));
        got_data = true;
        continue;
      }
      if (n == 0) {
        CloseFd(&stdout_fd_);
        break;
      }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      CloseFd(&stdout_fd_);
      break;
    }

    // A grandchild may hold stdout open after the server itself died.
    if (!got_data && stdout_fd_ >= 0 && stdout_buf_.find('\n') == std::string::npos && ReapIfExited()) {
      CloseFd(&stdout_fd_);
    }
  }
}

void ProcessTransport::Terminate(std::chrono::milliseconds grace) {
  CloseFd(&stdin_fd_);
  if (pid_ > 0) {
    if (!ReapIfExited()) {
      static_cast<void>(kill(pid_, SIGTERM));
      const auto deadline = std::chrono::steady_clock::now() + grace;
      while (!ReapIfExited() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      if (!exited_) {
        static_cast<void>(kill(pid_, SIGKILL));
        int status = 0;
        pid_t waited = 0;
        do {
          waited = waitpid(pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        exited_ = true;
        exit_status_ = status;
      }
    }
    pid_ = -1;
  }
  CloseFds();
}

bool ProcessTransport::IsRunning() {
  return pid_ > 0 && !ReapIfExited();
}

bool ProcessTransport::ReapIfExited() {
  if (exited_) return true;
  if (pid_ <= 0) return false;
  int status = 0;
  const pid_t waited = waitpid(pid_, &status, WNOHANG);
  if (waited == pid_) {
    exited_ = true;
    exit_status_ = status;
    return true;
  }
  if (waited < 0 && errno == ECHILD) {
    exited_ = true;
    return true;
  }
  return false;
}

void ProcessTransport::DrainStderr() {
  if (stderr_fd_ < 0) return;
  char buffer[4096];
  while (true) {
    const ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
    if (n > 0) {
      stderr_tail_.append(buffer, static_cast<size_t>(n));
      if (stderr_tail_.size() > kMaxStderrTail) stderr_tail_.erase(0, stderr_tail_.size() - kMaxStderrTail);
      continue;
    }
    if (n == 0) {
      CloseFd(&stderr_fd_);
      return;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) CloseFd(&stderr_fd_);
    return;
  }
}

void ProcessTransport::CloseFds() {
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
  stdout_buf_.clear();
}

std::string ProcessTransport::ExitDiagnostic() {
  std::string out = exited_ ? DescribeStatus(exit_status_) : std::string("still running");
  auto tail = stderr_tail_;
  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
  if (!tail.empty()) out += "; stderr: " + tail;
  return out;
}

}  // namespace homefin
