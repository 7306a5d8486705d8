// Repository: Rewind
// Component: Merge Command
// Purpose: Concat list and encoder arguments for merging chunks into one file.
// Copyright (c) 2026 Rewind

#ifndef REWIND_EXPORTER_MERGE_COMMAND_HPP_
#define REWIND_EXPORTER_MERGE_COMMAND_HPP_

#include <optional>
#include <string>
#include <vector>

#include "rewind/buffer/Chunk.hpp"

namespace rwd::exporter {

enum class ExportQuality { kHigh, kMedium, kLow };

struct QualityPreset {
  int crf;
  const char* x264_preset;
};

QualityPreset PresetFor(ExportQuality quality);
const char* QualityName(ExportQuality quality);
std::optional<ExportQuality> ParseQuality(const std::string& name);

// Directories probed for the encoder before $PATH.
std::vector<std::string> DefaultEncoderSearchDirs();

// Quotes a path for the concat demuxer: 'a'\''b'.
std::string QuoteConcatPath(const std::string& path);

// One "file '<path>'" line per chunk, in the given order.
std::string BuildConcatList(const std::vector<buffer::Chunk>& chunks);

// ffmpeg concat demuxer -> libx264/aac, +faststart.
std::vector<std::string> BuildMergeArgs(const std::string& list_path,
                                        const std::string& output_path,
                                        ExportQuality quality);

}  // namespace rwd::exporter

#endif  // REWIND_EXPORTER_MERGE_COMMAND_HPP_
