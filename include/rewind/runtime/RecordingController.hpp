// Repository: Rewind
// Component: Recording Controller
// Purpose: Idle/Recording state machine owning the chunk recorder lifecycle.
// Copyright (c) 2026 Rewind

#ifndef REWIND_RUNTIME_RECORDING_CONTROLLER_HPP_
#define REWIND_RUNTIME_RECORDING_CONTROLLER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "rewind/buffer/BufferStore.hpp"
#include "rewind/capture/ChunkRecorder.hpp"
#include "rewind/exporter/ExportCoordinator.hpp"
#include "rewind/process/ProcessGateway.hpp"

namespace rwd::runtime {

class RecordingController {
 public:
  enum class State {
    kIdle = 0,
    kRecording = 1,
  };

  struct StatusSnapshot {
    State state = State::kIdle;
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t start_noop_total = 0;
    uint64_t stop_noop_total = 0;

    size_t chunk_count = 0;
    int64_t oldest_chunk_ms = 0;  // 0 when the buffer is empty
    int64_t newest_chunk_ms = 0;
    int64_t buffered_ms = 0;      // Sum of nominal chunk durations
    uint64_t buffered_bytes = 0;

    capture::RecorderStats recorder;
    bool export_in_progress = false;
  };

  // Called after every transition, outside the state lock.
  using StateListener = std::function<void(State from, State to)>;

  // exporter may be null; it is only consulted for the status snapshot.
  RecordingController(std::shared_ptr<capture::ChunkRecorder> recorder,
                      std::shared_ptr<buffer::BufferStore> store,
                      std::shared_ptr<process::IProcessGateway> gateway,
                      std::shared_ptr<exporter::ExportCoordinator> exporter);
  ~RecordingController();

  RecordingController(const RecordingController&) = delete;
  RecordingController& operator=(const RecordingController&) = delete;

  // Idle -> Recording: discards stale chunks (records and stray files in the
  // buffer directory), then starts the recorder. No-op while Recording.
  // Throws RewindError(kCaptureUnavailable) if the capture program cannot be
  // resolved; the state stays Idle.
  void Start();

  // Recording -> Idle: returns once the recorder loop has exited. No-op
  // while Idle.
  void Stop();

  [[nodiscard]] State state() const;
  [[nodiscard]] StatusSnapshot Snapshot() const;

  void SetStateListener(StateListener listener);

 private:
  void TransitionTo(State to);

  std::shared_ptr<capture::ChunkRecorder> recorder_;
  std::shared_ptr<buffer::BufferStore> store_;
  std::shared_ptr<process::IProcessGateway> gateway_;
  std::shared_ptr<exporter::ExportCoordinator> exporter_;

  std::mutex op_mutex_;  // Serializes Start/Stop

  mutable std::mutex mutex_;
  State state_ = State::kIdle;
  std::map<std::pair<State, State>, uint64_t> transitions_;
  uint64_t start_noop_total_ = 0;
  uint64_t stop_noop_total_ = 0;
  StateListener listener_;
};

const char* StateName(RecordingController::State state);

}  // namespace rwd::runtime

#endif  // REWIND_RUNTIME_RECORDING_CONTROLLER_HPP_
