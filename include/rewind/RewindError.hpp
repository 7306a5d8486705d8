// Repository: Rewind
// Component: Error taxonomy
// Purpose: Typed errors surfaced by start/stop, export and the process gateway.
// Copyright (c) 2026 Rewind

#ifndef REWIND_REWIND_ERROR_HPP_
#define REWIND_REWIND_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace rwd {

enum class ErrorCode {
  kCaptureUnavailable,   // Capture program missing or not executable.
  kChunkCaptureFailed,   // One chunk iteration failed (recovered in the loop).
  kEmptyChunkFile,       // Capture finished but left no usable file.
  kEncoderNotFound,      // Merge/encode program missing.
  kMergeFailed,          // Merge process exited non-zero.
  kNoChunksAvailable,    // Export window contained no chunks.
  kProcessLaunchFailed,  // fork/pipe/exec failure.
  kProcessFailed,        // Generic non-zero exit.
  kExportInProgress,     // Another export is still running.
  kInvalidConfig,
  kIoError,
};

// Stable upper-snake name, used in log lines and on the wire.
const char* ErrorCodeName(ErrorCode code);

// RewindError carries the error code and, for process failures, the child's
// captured stderr verbatim.
class RewindError : public std::runtime_error {
 public:
  RewindError(ErrorCode code, const std::string& message,
              std::string diagnostics = "");

  ErrorCode code() const noexcept { return code_; }
  const std::string& diagnostics() const noexcept { return diagnostics_; }

 private:
  ErrorCode code_;
  std::string diagnostics_;
};

}  // namespace rwd

#endif  // REWIND_REWIND_ERROR_HPP_
