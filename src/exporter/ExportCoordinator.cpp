// Repository: Rewind
// Component: Export Coordinator
// Purpose: Merge the trailing window of buffered chunks into one recording.
// Copyright (c) 2026 Rewind

#include "rewind/exporter/ExportCoordinator.hpp"

#include <stdexcept>
#include <utility>

#include "rewind/RewindError.hpp"
#include "rewind/util/Logger.hpp"
#include "rewind/util/Timestamp.hpp"

namespace rwd::exporter {

using util::Logger;

namespace {

class InProgressGuard {
 public:
  explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~InProgressGuard() { flag_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool>& flag_;
};

// Deletes the concat list when the export leaves scope, success or failure.
class TempFileGuard {
 public:
  TempFileGuard(fs::IFileOps& files, std::string path)
      : files_(files), path_(std::move(path)) {}
  ~TempFileGuard() {
    std::string error;
    if (!files_.Remove(path_, &error)) {
      Logger::Warn("[ExportCoordinator] failed to remove concat list " + path_ +
                   ": " + error);
    }
  }

 private:
  fs::IFileOps& files_;
  std::string path_;
};

}  // namespace

ExportCoordinator::ExportCoordinator(
    ExportSettings settings, std::shared_ptr<process::IProcessGateway> gateway,
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
    throw std::invalid_argument("ExportCoordinator: missing collaborator");
  }
}

ExportArtifact ExportCoordinator::ExportLast(int64_t window_ms) {
  bool expected = false;
  if (!in_progress_.compare_exchange_strong(expected, true,
                                            std::memory_order_acq_rel)) {
    throw RewindError(ErrorCode::kExportInProgress,
                      "another export is still running");
  }
  InProgressGuard in_progress(in_progress_);

  if (window_ms <= 0) {
    throw RewindError(ErrorCode::kInvalidConfig,
                      "export window must be positive, got " +
                          std::to_string(window_ms) + "ms");
  }

  const int64_t now_ms = time_source_->NowUtcMs();
  const int64_t cutoff_ms = now_ms - window_ms;
  buffer::ChunkLease lease = store_->Lease(cutoff_ms, now_ms);
  if (lease.empty()) {
    Logger::Warn("[ExportCoordinator] no chunks in the last " +
                 std::to_string(window_ms) + "ms");
    throw RewindError(ErrorCode::kNoChunksAvailable,
                      "no chunks recorded in the last " +
                          std::to_string(window_ms / 1000) + "s");
  }
  const auto& chunks = lease.chunks();

  const auto encoder = gateway_->ResolveExecutable(settings_.encoder);
  if (!encoder) {
    throw RewindError(ErrorCode::kEncoderNotFound,
                      "encoder not found: " + settings_.encoder);
  }

  files_->EnsureDirectory(settings_.recordings_dir);
  files_->EnsureDirectory(settings_.temp_dir);

  Logger::Info("[ExportCoordinator] exporting " + std::to_string(chunks.size()) +
               " chunk(s) window=" + std::to_string(window_ms) + "ms quality=" +
               QualityName(settings_.quality));

  const std::string list_path = WriteConcatList(chunks, now_ms);
  TempFileGuard list_guard(*files_, list_path);
  const std::string output_path = UniqueOutputPath(now_ms);

  process::LaunchSpec spec;
  spec.executable = *encoder;
  spec.args = BuildMergeArgs(list_path, output_path, settings_.quality);
  spec.timeout = settings_.merge_timeout;
  spec.capture_stderr = true;
  spec.missing_executable_error = ErrorCode::kEncoderNotFound;
  spec.label = "merge";

  process::ProcessResult result = gateway_->Launch(spec)->Wait();
  if (!result.Ok()) {
    RemoveIfPresent(output_path, "partial export");
    Logger::Error("[ExportCoordinator] merge failed " + result.Describe() +
                  (result.stderr_text.empty() ? "" : "\n" + result.stderr_text));
    process::ThrowIfFailed(result, ErrorCode::kMergeFailed, "merge failed");
  }

  const auto size = files_->SizeOf(output_path);
  if (!size || *size == 0) {
    RemoveIfPresent(output_path, "empty export");
    throw RewindError(ErrorCode::kMergeFailed,
                      "encoder exited cleanly but produced no output",
                      result.stderr_text);
  }

  ExportArtifact artifact;
  artifact.path = output_path;
  artifact.created_at_ms = now_ms;
  artifact.size_bytes = *size;
  artifact.chunk_count = chunks.size();
  for (const auto& c : chunks) {
    artifact.chunk_ids.push_back(c.id);
    artifact.duration_ms += c.duration_ms;
  }
  if (probe_) {
    const auto info = probe_->Probe(output_path);
    if (info && info->duration_ms > 0) {
      artifact.duration_ms = info->duration_ms;
    }
  }

  Logger::Info("[ExportCoordinator] exported " + output_path + " duration_ms=" +
               std::to_string(artifact.duration_ms) + " bytes=" +
               std::to_string(artifact.size_bytes));
  return artifact;
}

std::string ExportCoordinator::WriteConcatList(
    const std::vector<buffer::Chunk>& chunks, int64_t now_ms) {
  const std::string path = settings_.temp_dir + "/rewind_concat_" +
                           util::FormatUtcForFileName(now_ms, true) + ".txt";
  files_->WriteFile(path, BuildConcatList(chunks));
  return path;
}

std::string ExportCoordinator::UniqueOutputPath(int64_t now_ms) const {
  const std::string stem = settings_.recordings_dir + "/recording_" +
                           util::FormatUtcForFileName(now_ms, false);
  std::string candidate = stem + "." + settings_.container;
  for (int n = 1; files_->SizeOf(candidate); ++n) {
    candidate = stem + "_" + std::to_string(n) + "." + settings_.container;
  }
  return candidate;
}

void ExportCoordinator::RemoveIfPresent(const std::string& path, const char* what) {
  if (!files_->SizeOf(path)) return;
  std::string error;
  if (!files_->Remove(path, &error)) {
    Logger::Warn(std::string("[ExportCoordinator] failed to remove ") + what +
                 " " + path + ": " + error);
  }
}

}  // namespace rwd::exporter
