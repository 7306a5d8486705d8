// Repository: Rewind
// Component: Recording Controller
// Purpose: Idle/Recording state machine owning the chunk recorder lifecycle.
// Copyright (c) 2026 Rewind

#include "rewind/runtime/RecordingController.hpp"

#include <stdexcept>
#include <string>

#include "rewind/RewindError.hpp"
#include "rewind/util/Logger.hpp"

namespace rwd::runtime {

using util::Logger;

const char* StateName(RecordingController::State state) {
  switch (state) {
    case RecordingController::State::kIdle: return "idle";
    case RecordingController::State::kRecording: return "recording";
  }
  return "unknown";
}

RecordingController::RecordingController(
    std::shared_ptr<capture::ChunkRecorder> recorder,
    std::shared_ptr<buffer::BufferStore> store,
    std::shared_ptr<process::IProcessGateway> gateway,
    std::shared_ptr<exporter::ExportCoordinator> exporter)
    : recorder_(std::move(recorder)),
      store_(std::move(store)),
      gateway_(std::move(gateway)),
      exporter_(std::move(exporter)) {
  if (!recorder_ || !store_ || !gateway_) {
    throw std::invalid_argument("RecordingController: missing collaborator");
  }
}

RecordingController::~RecordingController() { Stop(); }

void RecordingController::Start() {
  std::lock_guard<std::mutex> op_lock(op_mutex_);
  if (state() == State::kRecording) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++start_noop_total_;
    Logger::Debug("[RecordingController] Start ignored: already recording");
    return;
  }

  const auto& settings = recorder_->settings();
  if (!gateway_->ResolveExecutable(settings.capture_program)) {
    Logger::Error("[RecordingController] capture program unavailable: " +
                  settings.capture_program);
    throw RewindError(ErrorCode::kCaptureUnavailable,
                      "capture program not found or not executable: " +
                          settings.capture_program);
  }

  store_->ClearAll();
  store_->PurgeOrphans(settings.buffer_dir);
  recorder_->Start();
  TransitionTo(State::kRecording);
}

void RecordingController::Stop() {
  std::lock_guard<std::mutex> op_lock(op_mutex_);
  if (state() == State::kIdle) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stop_noop_total_;
    return;
  }
  recorder_->Stop();
  TransitionTo(State::kIdle);
}

RecordingController::State RecordingController::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

RecordingController::StatusSnapshot RecordingController::Snapshot() const {
  StatusSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snap.state = state_;
    snap.transitions = transitions_;
    snap.start_noop_total = start_noop_total_;
    snap.stop_noop_total = stop_noop_total_;
  }

  const auto chunks = store_->Snapshot();
  snap.chunk_count = chunks.size();
  if (!chunks.empty()) {
    snap.oldest_chunk_ms = chunks.front().created_at_ms;
    snap.newest_chunk_ms = chunks.back().created_at_ms;
  }
  for (const auto& c : chunks) {
    snap.buffered_ms += c.duration_ms;
    snap.buffered_bytes += c.size_bytes;
  }
  snap.recorder = recorder_->GetStats();
  snap.export_in_progress = exporter_ && exporter_->InProgress();
  return snap;
}

void RecordingController::SetStateListener(StateListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void RecordingController::TransitionTo(State to) {
  State from;
  StateListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    state_ = to;
    ++transitions_[{from, to}];
    listener = listener_;
  }
  Logger::Info(std::string("[RecordingController] ") + StateName(from) + " -> " +
               StateName(to));
  if (listener) listener(from, to);
}

}  // namespace rwd::runtime
