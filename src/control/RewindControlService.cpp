// Repository: Rewind
// Component: RewindControl gRPC Service Implementation
// Purpose: Implements the RewindControl service on top of the recording core.
// Copyright (c) 2026 Rewind

#include "control/RewindControlService.h"

#include <cmath>
#include <string>
#include <utility>

#include "rewind/RewindError.hpp"
#include "rewind/util/Logger.hpp"
#include "rewind/util/Timestamp.hpp"

namespace rwd::control {

using util::Logger;

namespace {

// One day; no buffer configuration retains more than that.
constexpr double kMaxExportWindowSeconds = 86'400.0;

grpc::Status ToStatus(const RewindError& e) {
  grpc::StatusCode code = grpc::StatusCode::INTERNAL;
  switch (e.code()) {
    case ErrorCode::kCaptureUnavailable:
    case ErrorCode::kEncoderNotFound:
      code = grpc::StatusCode::FAILED_PRECONDITION;
      break;
    case ErrorCode::kNoChunksAvailable:
      code = grpc::StatusCode::NOT_FOUND;
      break;
    case ErrorCode::kExportInProgress:
      code = grpc::StatusCode::ABORTED;
      break;
    case ErrorCode::kInvalidConfig:
      code = grpc::StatusCode::INVALID_ARGUMENT;
      break;
    default:
      break;
  }
  return grpc::Status(code, e.what());
}

uint64_t TransitionsInto(const runtime::RecordingController::StatusSnapshot& snap,
                         runtime::RecordingController::State to) {
  uint64_t total = 0;
  for (const auto& entry : snap.transitions) {
    if (entry.first.second == to) total += entry.second;
  }
  return total;
}

}  // namespace

RewindControlImpl::RewindControlImpl(
    std::shared_ptr<runtime::RecordingController> controller,
    std::shared_ptr<exporter::ExportCoordinator> exporter,
    std::shared_ptr<buffer::BufferStore> store, int64_t default_export_window_ms)
    : controller_(std::move(controller)),
      exporter_(std::move(exporter)),
      store_(std::move(store)),
      default_export_window_ms_(default_export_window_ms) {}

RewindControlImpl::~RewindControlImpl() = default;

grpc::Status RewindControlImpl::Start(grpc::ServerContext* /*context*/,
                                      const StartRequest* /*request*/,
                                      StartResponse* response) {
  Logger::Info("[Start] Request received");
  try {
    controller_->Start();
  } catch (const RewindError& e) {
    Logger::Error(std::string("[Start] failed: ") + e.what());
    response->set_success(false);
    response->set_message(e.what());
    response->set_state(runtime::StateName(controller_->state()));
    return ToStatus(e);
  }
  response->set_success(true);
  response->set_message("recording");
  response->set_state(runtime::StateName(controller_->state()));
  return grpc::Status::OK;
}

grpc::Status RewindControlImpl::Stop(grpc::ServerContext* /*context*/,
                                     const StopRequest* /*request*/,
                                     StopResponse* response) {
  Logger::Info("[Stop] Request received");
  controller_->Stop();
  response->set_success(true);
  response->set_message("idle");
  response->set_state(runtime::StateName(controller_->state()));
  return grpc::Status::OK;
}

grpc::Status RewindControlImpl::ExportLast(grpc::ServerContext* /*context*/,
                                           const ExportLastRequest* request,
                                           ExportLastResponse* response) {
  const double window_seconds = request->window_seconds();
  if (!std::isfinite(window_seconds) || window_seconds > kMaxExportWindowSeconds) {
    const std::string message =
        "INVALID_ARGUMENT: window_seconds must be finite and at most " +
        std::to_string(static_cast<int64_t>(kMaxExportWindowSeconds));
    Logger::Warn("[ExportLast] rejected window_seconds=" + std::to_string(window_seconds));
    response->set_success(false);
    response->set_message(message);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
  }
  const int64_t window_ms =
      window_seconds > 0
          ? static_cast<int64_t>(std::llround(window_seconds * 1000.0))
          : default_export_window_ms_;
  Logger::Info("[ExportLast] Request received: window_ms=" + std::to_string(window_ms));

  try {
    const exporter::ExportArtifact artifact = exporter_->ExportLast(window_ms);
    response->set_success(true);
    response->set_message("exported " + artifact.path);
    response->set_path(artifact.path);
    response->set_created_at_utc_ms(artifact.created_at_ms);
    response->set_duration_ms(artifact.duration_ms);
    response->set_size_bytes(artifact.size_bytes);
    response->set_chunk_count(static_cast<uint32_t>(artifact.chunk_count));
    for (const auto& id : artifact.chunk_ids) response->add_chunk_ids(id);
  } catch (const RewindError& e) {
    Logger::Error(std::string("[ExportLast] failed: ") + ErrorCodeName(e.code()));
    response->set_success(false);
    response->set_message(e.what());
    return ToStatus(e);
  }
  return grpc::Status::OK;
}

grpc::Status RewindControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                          const StatusRequest* /*request*/,
                                          StatusResponse* response) {
  using State = runtime::RecordingController::State;
  const auto snap = controller_->Snapshot();
  response->set_state(runtime::StateName(snap.state));
  response->set_chunk_count(static_cast<uint32_t>(snap.chunk_count));
  response->set_oldest_chunk_utc_ms(snap.oldest_chunk_ms);
  response->set_newest_chunk_utc_ms(snap.newest_chunk_ms);
  response->set_buffered_ms(snap.buffered_ms);
  response->set_buffered_bytes(snap.buffered_bytes);
  response->set_iterations(snap.recorder.iterations);
  response->set_chunks_recorded(snap.recorder.chunks_recorded);
  response->set_chunks_discarded(snap.recorder.chunks_discarded);
  response->set_backoffs(snap.recorder.backoffs);
  response->set_consecutive_failures(snap.recorder.consecutive_failures);
  response->set_export_in_progress(snap.export_in_progress);
  response->set_start_total(TransitionsInto(snap, State::kRecording));
  response->set_stop_total(TransitionsInto(snap, State::kIdle));
  return grpc::Status::OK;
}

grpc::Status RewindControlImpl::ListChunks(grpc::ServerContext* /*context*/,
                                           const ListChunksRequest* /*request*/,
                                           ListChunksResponse* response) {
  for (const auto& c : store_->Snapshot()) {
    ChunkInfo* info = response->add_chunks();
    info->set_id(c.id);
    info->set_path(c.path);
    info->set_created_at_utc_ms(c.created_at_ms);
    info->set_duration_ms(c.duration_ms);
    info->set_size_bytes(c.size_bytes);
    info->set_created_at_iso(util::FormatUtcIso8601(c.created_at_ms));
  }
  return grpc::Status::OK;
}

}  // namespace rwd::control
