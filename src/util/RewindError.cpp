// Repository: Rewind
// Component: Error taxonomy
// Purpose: Typed errors surfaced by start/stop, export and the process gateway.
// Copyright (c) 2026 Rewind

#include "rewind/RewindError.hpp"

#include <utility>

namespace rwd {

namespace {

std::string ComposeWhat(ErrorCode code, const std::string& message,
                        const std::string& diagnostics) {
  std::string what = std::string(ErrorCodeName(code)) + ": " + message;
  if (!diagnostics.empty()) {
    what += "\n";
    what += diagnostics;
  }
  return what;
}

}  // namespace

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kCaptureUnavailable: return "CAPTURE_UNAVAILABLE";
    case ErrorCode::kChunkCaptureFailed: return "CHUNK_CAPTURE_FAILED";
    case ErrorCode::kEmptyChunkFile: return "EMPTY_CHUNK_FILE";
    case ErrorCode::kEncoderNotFound: return "ENCODER_NOT_FOUND";
    case ErrorCode::kMergeFailed: return "MERGE_FAILED";
    case ErrorCode::kNoChunksAvailable: return "NO_CHUNKS_AVAILABLE";
    case ErrorCode::kProcessLaunchFailed: return "PROCESS_LAUNCH_FAILED";
    case ErrorCode::kProcessFailed: return "PROCESS_FAILED";
    case ErrorCode::kExportInProgress: return "EXPORT_IN_PROGRESS";
    case ErrorCode::kInvalidConfig: return "INVALID_CONFIG";
    case ErrorCode::kIoError: return "IO_ERROR";
  }
  return "UNKNOWN";
}

RewindError::RewindError(ErrorCode code, const std::string& message,
                         std::string diagnostics)
    : std::runtime_error(ComposeWhat(code, message, diagnostics)),
      code_(code),
      diagnostics_(std::move(diagnostics)) {}

}  // namespace rwd
