// Repository: Rewind
// Component: Chunk Recorder
// Purpose: Perpetual record / validate / register loop feeding the buffer.
// Copyright (c) 2026 Rewind

#include "rewind/capture/ChunkRecorder.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include "rewind/capture/CaptureCommand.hpp"
#include "rewind/util/Logger.hpp"

namespace rwd::capture {

using util::Logger;

namespace {

// Clears the single-flight flag when an iteration leaves scope.
class InFlightGuard {
 public:
  explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~InFlightGuard() { flag_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool>& flag_;
};

std::string FileNameOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace

ChunkRecorder::ChunkRecorder(RecorderSettings settings,
                             std::shared_ptr<process::IProcessGateway> gateway,
                             std::shared_ptr<buffer::BufferStore> store,
                             std::shared_ptr<fs::IFileOps> files,
                             std::shared_ptr<time::ITimeSource> time_source,
                             std::shared_ptr<media::IMediaProbe> probe)
    : settings_(std::move(settings)),
      gateway_(std::move(gateway)),
      store_(std::move(store)),
      files_(std::move(files)),
      time_source_(std::move(time_source)),
      probe_(std::move(probe)) {
  if (!gateway_ || !store_ || !files_ || !time_source_) {
    throw std::invalid_argument("ChunkRecorder: missing collaborator");
  }
}

ChunkRecorder::~ChunkRecorder() { Stop(); }

bool ChunkRecorder::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (loop_thread_.joinable()) {
    Logger::Debug("[ChunkRecorder] Start ignored: loop already running");
    return false;
  }
  files_->EnsureDirectory(settings_.buffer_dir);
  {
    std::lock_guard<std::mutex> wake_lock(wake_mutex_);
    stop_requested_.store(false, std::memory_order_release);
  }
  consecutive_failures_.store(0);
  running_.store(true, std::memory_order_release);
  loop_thread_ = std::thread(&ChunkRecorder::Loop, this);
  Logger::Info("[ChunkRecorder] started: chunk=" +
               std::to_string(settings_.chunk_duration_ms) + "ms buffer=" +
               std::to_string(settings_.buffer_duration_ms) + "ms dir=" +
               settings_.buffer_dir);
  return true;
}

void ChunkRecorder::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!loop_thread_.joinable()) return;

  {
    std::lock_guard<std::mutex> wake_lock(wake_mutex_);
    stop_requested_.store(true, std::memory_order_release);
  }
  wake_cv_.notify_all();

  {
    std::lock_guard<std::mutex> handle_lock(handle_mutex_);
    if (current_) {
      Logger::Info("[ChunkRecorder] cancelling in-flight capture");
      current_->Cancel();
    }
  }

  loop_thread_.join();
  running_.store(false, std::memory_order_release);
  Logger::Info("[ChunkRecorder] stopped");
}

RecorderStats ChunkRecorder::GetStats() const {
  RecorderStats stats;
  stats.iterations = iterations_.load();
  stats.chunks_recorded = chunks_recorded_.load();
  stats.chunks_discarded = chunks_discarded_.load();
  stats.backoffs = backoffs_.load();
  stats.consecutive_failures = consecutive_failures_.load();
  return stats;
}

int64_t ChunkRecorder::BackoffDelayMs(int consecutive_failures,
                                      const RecorderSettings& settings) {
  if (consecutive_failures < settings.failure_threshold) return 0;
  const int shift = std::min(consecutive_failures - settings.failure_threshold, 20);
  const int64_t delay = settings.backoff_base_ms * (int64_t{1} << shift);
  return std::min(delay, settings.backoff_max_ms);
}

void ChunkRecorder::Loop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    try {
      RunOnce();
    } catch (const std::exception& e) {
      const int failures = consecutive_failures_.fetch_add(1) + 1;
      Logger::Error("[ChunkRecorder] iteration failed (failures=" +
                    std::to_string(failures) + "): " + e.what());
    }

    const int64_t delay_ms =
        BackoffDelayMs(consecutive_failures_.load(), settings_);
    if (delay_ms <= 0) continue;

    backoffs_.fetch_add(1);
    Logger::Warn("[ChunkRecorder] " + std::to_string(consecutive_failures_.load()) +
                 " consecutive failures, backing off " +
                 std::to_string(delay_ms) + "ms");
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] {
      return stop_requested_.load(std::memory_order_acquire);
    });
  }
}

bool ChunkRecorder::RunOnce() {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel)) {
    Logger::Debug("[ChunkRecorder] capture already in flight, ignoring");
    return false;
  }
  InFlightGuard guard(in_flight_);

  const int64_t now_ms = time_source_->NowUtcMs();
  store_->EvictExpired(now_ms, settings_.buffer_duration_ms);

  const std::string path =
      buffer::ChunkPathFor(settings_.buffer_dir, now_ms, settings_.container);

  process::LaunchSpec spec;
  spec.executable = settings_.capture_program;
  spec.args = ExpandCaptureArgs(settings_.capture_args, path,
                                settings_.chunk_duration_ms);
  spec.timeout = std::chrono::milliseconds(settings_.chunk_duration_ms +
                                           settings_.completion_grace_ms);
  spec.capture_stderr = true;
  spec.missing_executable_error = ErrorCode::kCaptureUnavailable;
  spec.label = "capture";

  std::shared_ptr<process::IProcessHandle> handle;
  try {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    if (stop_requested_.load(std::memory_order_acquire)) return false;
    iterations_.fetch_add(1);
    handle = gateway_->Launch(spec);
    current_ = handle;
  } catch (const RewindError& e) {
    Discard(path, ErrorCode::kChunkCaptureFailed,
            std::string("launch failed: ") + e.what());
    return false;
  } catch (const std::exception& e) {
    Discard(path, ErrorCode::kChunkCaptureFailed,
            std::string("launch failed unexpectedly: ") + e.what());
    return false;
  }
  Logger::Debug("[ChunkRecorder] capturing " + FileNameOf(path));

  const process::ProcessResult result = handle->Wait();
  {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    current_.reset();
  }

  ErrorCode code = ErrorCode::kChunkCaptureFailed;
  std::string reason;
  auto chunk = ValidateOutput(path, now_ms, result, &code, &reason);
  if (!chunk) {
    Discard(path, code, reason);
    return false;
  }

  store_->Add(std::move(*chunk));
  chunks_recorded_.fetch_add(1);
  consecutive_failures_.store(0);
  return true;
}

std::optional<buffer::Chunk> ChunkRecorder::ValidateOutput(
    const std::string& path, int64_t created_at_ms,
    const process::ProcessResult& result, ErrorCode* code, std::string* reason) {
  if (!result.Ok() && !result.cancelled) {
    *code = ErrorCode::kChunkCaptureFailed;
    *reason = "capture " + result.Describe();
    if (!result.stderr_text.empty()) *reason += "\n" + result.stderr_text;
    return std::nullopt;
  }

  const auto size = files_->SizeOf(path);
  if (!size) {
    *code = ErrorCode::kEmptyChunkFile;
    *reason = "capture produced no file (" + result.Describe() + ")";
    return std::nullopt;
  }
  if (*size == 0) {
    *code = ErrorCode::kEmptyChunkFile;
    *reason = "capture produced an empty file (" + result.Describe() + ")";
    return std::nullopt;
  }

  if (settings_.validate_chunks && probe_) {
    if (!probe_->Probe(path)) {
      *code = ErrorCode::kEmptyChunkFile;
      *reason = "unreadable container (" + result.Describe() + ")";
      return std::nullopt;
    }
  }

  buffer::Chunk chunk;
  chunk.id = buffer::GenerateChunkId();
  chunk.path = path;
  chunk.created_at_ms = created_at_ms;
  chunk.duration_ms = settings_.chunk_duration_ms;
  chunk.size_bytes = *size;
  return chunk;
}

void ChunkRecorder::Discard(const std::string& path, ErrorCode code,
                            const std::string& reason) {
  if (files_->SizeOf(path)) {
    std::string error;
    if (!files_->Remove(path, &error)) {
      Logger::Warn("[ChunkRecorder] failed to delete partial " + FileNameOf(path) +
                   ": " + error);
    }
  }
  chunks_discarded_.fetch_add(1);
  const int failures = consecutive_failures_.fetch_add(1) + 1;
  Logger::Warn("[ChunkRecorder] discarded " + FileNameOf(path) + " (" +
               ErrorCodeName(code) + ", failures=" + std::to_string(failures) +
               "): " + reason);
}

}  // namespace rwd::capture
