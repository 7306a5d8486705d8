// Repository: Rewind
// Component: External Process Gateway
// Purpose: Launch and supervise capture/encode child processes.
// Copyright (c) 2026 Rewind

#ifndef REWIND_PROCESS_PROCESS_GATEWAY_HPP_
#define REWIND_PROCESS_PROCESS_GATEWAY_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rewind/RewindError.hpp"

namespace rwd::process {

// LaunchSpec describes one child process.
struct LaunchSpec {
  std::string executable;          // Absolute path, or a name resolved via PATH
  std::vector<std::string> args;   // argv[1..]
  std::optional<std::chrono::milliseconds> timeout;  // Hard limit; SIGINT then SIGKILL
  bool capture_stdout = false;     // Uncaptured streams go to /dev/null
  bool capture_stderr = true;

  // Error raised by Launch() when the executable cannot be found.
  // Capture launches use kCaptureUnavailable, merges kEncoderNotFound.
  ErrorCode missing_executable_error = ErrorCode::kProcessLaunchFailed;

  // Short label for log lines ("capture", "merge").
  std::string label = "process";
};

// ProcessResult is the completion signal of a handle.
struct ProcessResult {
  int exit_code = -1;       // Valid when term_signal == 0
  int term_signal = 0;      // Non-zero when the child died from a signal
  bool cancelled = false;   // Cancel() was called before exit
  bool timed_out = false;   // LaunchSpec::timeout elapsed
  std::string stdout_text;
  std::string stderr_text;

  bool Ok() const { return term_signal == 0 && exit_code == 0; }

  // "exit=1", "signal=9 (cancelled)", ...
  std::string Describe() const;
};

// Handle to one launched child. Every handle reaps its child exactly once,
// whether the child exits on its own, is cancelled, or the handle is
// destroyed first (destruction cancels and waits).
class IProcessHandle {
 public:
  virtual ~IProcessHandle() = default;

  // Requests termination. Idempotent; a no-op after natural completion.
  virtual void Cancel() = 0;

  // Blocks until the child has exited and been reaped. Repeated calls
  // return the same result.
  virtual ProcessResult Wait() = 0;

  // True once the child has exited (non-blocking).
  virtual bool Finished() const = 0;
};

class IProcessGateway {
 public:
  virtual ~IProcessGateway() = default;

  // Spawns the process. Throws RewindError with spec.missing_executable_error
  // when the executable is not found, kProcessLaunchFailed when spawning
  // fails.
  virtual std::shared_ptr<IProcessHandle> Launch(const LaunchSpec& spec) = 0;

  // Returns the absolute path the executable would run from, if any.
  virtual std::optional<std::string> ResolveExecutable(
      const std::string& name) const = 0;
};

// Throws RewindError(code, message, result.stderr_text) unless result.Ok().
void ThrowIfFailed(const ProcessResult& result, ErrorCode code,
                   const std::string& message);

}  // namespace rwd::process

#endif  // REWIND_PROCESS_PROCESS_GATEWAY_HPP_
