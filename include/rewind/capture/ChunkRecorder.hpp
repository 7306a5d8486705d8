// Repository: Rewind
// Component: Chunk Recorder
// Purpose: Perpetual record / validate / register loop feeding the buffer.
// Copyright (c) 2026 Rewind

#ifndef REWIND_CAPTURE_CHUNK_RECORDER_HPP_
#define REWIND_CAPTURE_CHUNK_RECORDER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "rewind/RewindError.hpp"
#include "rewind/buffer/BufferStore.hpp"
#include "rewind/fs/IFileOps.hpp"
#include "rewind/media/MediaProbe.hpp"
#include "rewind/process/ProcessGateway.hpp"
#include "rewind/time/ITimeSource.hpp"

namespace rwd::capture {

struct RecorderSettings {
  std::string buffer_dir;
  int64_t chunk_duration_ms = 10'000;
  int64_t buffer_duration_ms = 120'000;

  std::string capture_program;             // Resolved path of the capture tool
  std::vector<std::string> capture_args;   // Template, see CaptureCommand.hpp
  std::string container = "mp4";

  // Open each finished chunk with the media probe and discard unreadable ones.
  bool validate_chunks = true;

  // Added to the chunk duration to form the capture process hard timeout.
  int64_t completion_grace_ms = 5'000;

  // Backoff engages once this many iterations in a row have failed.
  int failure_threshold = 3;
  int64_t backoff_base_ms = 500;
  int64_t backoff_max_ms = 10'000;
};

struct RecorderStats {
  uint64_t iterations = 0;
  uint64_t chunks_recorded = 0;
  uint64_t chunks_discarded = 0;
  uint64_t backoffs = 0;
  int consecutive_failures = 0;
};

// ChunkRecorder owns the background capture loop.
//
// Each iteration: evict expired chunks, launch one capture process that
// terminates on its own after chunk_duration_ms, wait for it, then register
// the output file or discard it. A failed iteration is logged and counted
// and the loop continues.
//
// Single flight: at most one capture process exists at a time.
// Stop() cancels the in-flight capture and joins the loop; a chunk whose
// capture was cancelled is still validated and may be registered, but only
// before Stop() returns.
class ChunkRecorder {
 public:
  // probe may be null (no container validation).
  ChunkRecorder(RecorderSettings settings,
                std::shared_ptr<process::IProcessGateway> gateway,
                std::shared_ptr<buffer::BufferStore> store,
                std::shared_ptr<fs::IFileOps> files,
                std::shared_ptr<time::ITimeSource> time_source,
                std::shared_ptr<media::IMediaProbe> probe);
  ~ChunkRecorder();

  ChunkRecorder(const ChunkRecorder&) = delete;
  ChunkRecorder& operator=(const ChunkRecorder&) = delete;

  // Spawns the loop thread. Returns false (no-op) if already running.
  // Throws RewindError(kIoError) if the buffer directory cannot be created.
  bool Start();

  // Idempotent. Blocks until the loop thread has exited.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  RecorderStats GetStats() const;

  // One loop iteration on the calling thread. Returns true if a chunk was
  // registered. Returns false immediately, without launching anything, if
  // another iteration is in flight or Stop() has been requested.
  bool RunOnce();

  const RecorderSettings& settings() const { return settings_; }

  // 0 below the threshold, then base * 2^(n - threshold) capped at max.
  static int64_t BackoffDelayMs(int consecutive_failures,
                                const RecorderSettings& settings);

 private:
  void Loop();

  // Returns the chunk to register, or nullopt with *code / *reason set.
  std::optional<buffer::Chunk> ValidateOutput(const std::string& path,
                                              int64_t created_at_ms,
                                              const process::ProcessResult& result,
                                              ErrorCode* code,
                                              std::string* reason);

  void Discard(const std::string& path, ErrorCode code, const std::string& reason);

  const RecorderSettings settings_;
  std::shared_ptr<process::IProcessGateway> gateway_;
  std::shared_ptr<buffer::BufferStore> store_;
  std::shared_ptr<fs::IFileOps> files_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<media::IMediaProbe> probe_;

  std::mutex lifecycle_mutex_;  // Serializes Start/Stop
  std::thread loop_thread_;
  std::atomic<bool> running_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::atomic<bool> stop_requested_{false};

  std::mutex handle_mutex_;
  std::shared_ptr<process::IProcessHandle> current_;
  std::atomic<bool> in_flight_{false};

  std::atomic<uint64_t> iterations_{0};
  std::atomic<uint64_t> chunks_recorded_{0};
  std::atomic<uint64_t> chunks_discarded_{0};
  std::atomic<uint64_t> backoffs_{0};
  std::atomic<int> consecutive_failures_{0};
};

}  // namespace rwd::capture

#endif  // REWIND_CAPTURE_CHUNK_RECORDER_HPP_
