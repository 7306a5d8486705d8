// Repository: Rewind
// Component: Merge Command
// Purpose: Concat list and encoder arguments for merging chunks into one file.
// Copyright (c) 2026 Rewind

#include "rewind/exporter/MergeCommand.hpp"

#include <sstream>

namespace rwd::exporter {

QualityPreset PresetFor(ExportQuality quality) {
  switch (quality) {
    case ExportQuality::kHigh:
      return {18, "slow"};
    case ExportQuality::kLow:
      return {28, "faster"};
    case ExportQuality::kMedium:
    default:
      return {23, "medium"};
  }
}

const char* QualityName(ExportQuality quality) {
  switch (quality) {
    case ExportQuality::kHigh: return "high";
    case ExportQuality::kLow: return "low";
    case ExportQuality::kMedium:
    default: return "medium";
  }
}

std::optional<ExportQuality> ParseQuality(const std::string& name) {
  if (name == "high") return ExportQuality::kHigh;
  if (name == "medium") return ExportQuality::kMedium;
  if (name == "low") return ExportQuality::kLow;
  return std::nullopt;
}

std::vector<std::string> DefaultEncoderSearchDirs() {
  return {"/usr/local/bin", "/usr/bin", "/opt/homebrew/bin", "/opt/local/bin"};
}

std::string QuoteConcatPath(const std::string& path) {
  std::string out = "'";
  for (char c : path) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string BuildConcatList(const std::vector<buffer::Chunk>& chunks) {
  std::ostringstream o;
  for (const auto& chunk : chunks) {
    o << "file " << QuoteConcatPath(chunk.path) << '\n';
  }
  return o.str();
}

std::vector<std::string> BuildMergeArgs(const std::string& list_path,
                                        const std::string& output_path,
                                        ExportQuality quality) {
  const QualityPreset preset = PresetFor(quality);
  return {
      "-nostdin", "-hide_banner", "-loglevel", "error",
      "-f", "concat", "-safe", "0", "-i", list_path,
      "-c:v", "libx264", "-crf", std::to_string(preset.crf),
      "-preset", preset.x264_preset,
      "-c:a", "aac", "-b:a", "128k",
      "-movflags", "+faststart",
      "-y", output_path,
  };
}

}  // namespace rwd::exporter
