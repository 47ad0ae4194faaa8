#pragma once

#include "tool_errors.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace homefin {

struct LaunchSpec {
  std::vector<std::string> command;
  std::string working_directory;
  // Overrides applied on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  // Inherited variables whose names start with one of these are not passed on.
  std::vector<std::string> drop_env_prefixes;
};

// Owns exactly one child process and its stdin/stdout/stderr pipes.
// Not thread-safe; McpClient serializes access.
class ProcessTransport {
 public:
  ProcessTransport() = default;
  ~ProcessTransport();
  ProcessTransport(const ProcessTransport&) = delete;
  ProcessTransport& operator=(const ProcessTransport&) = delete;

  // Fails with kPathResolution when the working directory or the binary is
  // missing, kSpawn when pipe/fork/exec fails. The child runs on return.
  bool Start(const LaunchSpec& spec, ToolError* err);

  // Fails with kTimeout when the child stops reading stdin for longer than
  // timeout. timeout <= 0 waits forever.
  bool WriteLine(const std::string& text, ToolError* err,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  // Blocks until a full line is available. timeout <= 0 waits forever.
  // On EOF the stderr tail is folded into a kUnexpectedExit message.
  std::optional<std::string> ReadLine(std::chrono::milliseconds timeout, ToolError* err);

  // Closes stdin, SIGTERM, waits up to grace, then SIGKILL. Idempotent.
  void Terminate(std::chrono::milliseconds grace);

  bool IsRunning();
  pid_t pid() const { return pid_; }
  const std::string& StderrTail() const { return stderr_tail_; }

  void SetCancelToken(std::shared_ptr<std::atomic_bool> cancel_token) { cancel_token_ = std::move(cancel_token); }

 private:
  bool ReapIfExited();
  void DrainStderr();
  void CloseFds();
  std::string ExitDiagnostic();

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool exited_ = false;
  int exit_status_ = 0;
  std::string stdout_buf_;
  std::string stderr_tail_;
  std::shared_ptr<std::atomic_bool> cancel_token_;
};

}  // namespace homefin
