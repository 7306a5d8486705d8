// Repository: Rewind
// Component: Export Coordinator
// Purpose: Merge the trailing window of buffered chunks into one recording.
// Copyright (c) 2026 Rewind

#ifndef REWIND_EXPORTER_EXPORT_COORDINATOR_HPP_
#define REWIND_EXPORTER_EXPORT_COORDINATOR_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rewind/buffer/BufferStore.hpp"
#include "rewind/exporter/MergeCommand.hpp"
#include "rewind/fs/IFileOps.hpp"
#include "rewind/media/MediaProbe.hpp"
#include "rewind/process/ProcessGateway.hpp"
#include "rewind/time/ITimeSource.hpp"

namespace rwd::exporter {

struct ExportSettings {
  std::string recordings_dir;
  std::string temp_dir;             // Concat list files
  std::string encoder = "ffmpeg";   // Name or absolute path
  ExportQuality quality = ExportQuality::kMedium;
  std::string container = "mp4";
  std::optional<std::chrono::milliseconds> merge_timeout;
};

struct ExportArtifact {
  std::string path;
  int64_t created_at_ms = 0;
  int64_t duration_ms = 0;
  uint64_t size_bytes = 0;
  size_t chunk_count = 0;
  std::vector<std::string> chunk_ids;
};

// ExportCoordinator produces "the last N seconds" on demand.
//
// The chunk selection is leased from the BufferStore for the duration of the
// merge, so the recorder can keep evicting without deleting files the
// encoder is still reading. Export never mutates the buffer.
//
// Errors (RewindError): kExportInProgress, kNoChunksAvailable (no process
// spawned), kEncoderNotFound, kMergeFailed (stderr in diagnostics(), no
// partial output left behind), kProcessLaunchFailed, kIoError.
class ExportCoordinator {
 public:
  ExportCoordinator(ExportSettings settings,
                    std::shared_ptr<process::IProcessGateway> gateway,
                    std::shared_ptr<buffer::BufferStore> store,
                    std::shared_ptr<fs::IFileOps> files,
                    std::shared_ptr<time::ITimeSource> time_source,
                    std::shared_ptr<media::IMediaProbe> probe);

  ExportCoordinator(const ExportCoordinator&) = delete;
  ExportCoordinator& operator=(const ExportCoordinator&) = delete;

  // Blocks until the merge finishes.
  ExportArtifact ExportLast(int64_t window_ms);

  bool InProgress() const { return in_progress_.load(std::memory_order_acquire); }

  const ExportSettings& settings() const { return settings_; }

 private:
  std::string WriteConcatList(const std::vector<buffer::Chunk>& chunks,
                              int64_t now_ms);
  std::string UniqueOutputPath(int64_t now_ms) const;
  void RemoveIfPresent(const std::string& path, const char* what);

  const ExportSettings settings_;
  std::shared_ptr<process::IProcessGateway> gateway_;
  std::shared_ptr<buffer::BufferStore> store_;
  std::shared_ptr<fs::IFileOps> files_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<media::IMediaProbe> probe_;

  std::atomic<bool> in_progress_{false};
};

}  // namespace rwd::exporter

#endif  // REWIND_EXPORTER_EXPORT_COORDINATOR_HPP_
