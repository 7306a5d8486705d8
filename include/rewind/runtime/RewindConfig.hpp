// Repository: Rewind
// Component: Daemon Configuration
// Purpose: Defaults, environment layer and command-line parsing for rewindd.
// Copyright (c) 2026 Rewind

#ifndef REWIND_RUNTIME_REWIND_CONFIG_HPP_
#define REWIND_RUNTIME_REWIND_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "rewind/capture/ChunkRecorder.hpp"
#include "rewind/exporter/ExportCoordinator.hpp"
#include "rewind/exporter/MergeCommand.hpp"

namespace rwd::runtime {

// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// std::getenv.
EnvLookup SystemEnv();

struct RewindConfig {
  std::string buffer_dir;
  std::string recordings_dir;
  std::string temp_dir;

  int64_t chunk_duration_ms = 10'000;
  int64_t buffer_duration_ms = 120'000;
  int64_t export_window_ms = 60'000;

  std::string capture_program = "ffmpeg";
  std::vector<std::string> capture_args;

  std::string encoder = "ffmpeg";
  std::vector<std::string> encoder_search_dirs;
  exporter::ExportQuality quality = exporter::ExportQuality::kMedium;
  std::string container = "mp4";

  bool validate_chunks = true;
  int failure_threshold = 3;
  int64_t backoff_base_ms = 500;
  int64_t backoff_max_ms = 10'000;

  std::string listen_address = "127.0.0.1:50071";
  bool autostart = true;

  // Directories from XDG_RUNTIME_DIR / HOME / TMPDIR, capture template on
  // $DISPLAY (":0" when unset).
  static RewindConfig Defaults(const EnvLookup& env);

  // REWIND_BUFFER_DIR, REWIND_RECORDINGS_DIR, REWIND_LISTEN, REWIND_ENCODER.
  void ApplyEnvironment(const EnvLookup& env);

  // Throws RewindError(kInvalidConfig) describing the first violation.
  void Validate() const;

  capture::RecorderSettings ToRecorderSettings() const;
  exporter::ExportSettings ToExportSettings() const;
};

struct CliArgs {
  RewindConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Defaults, then the environment layer, then flags. Does not call Validate().
CliArgs ParseArgs(int argc, const char* const argv[], const EnvLookup& env);

void PrintUsage(const char* program_name);

}  // namespace rwd::runtime

#endif  // REWIND_RUNTIME_REWIND_CONFIG_HPP_
