// Repository: Rewind
// Component: Daemon Configuration
// Purpose: Defaults, environment layer and command-line parsing for rewindd.
// Copyright (c) 2026 Rewind

#include "rewind/runtime/RewindConfig.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "rewind/RewindError.hpp"
#include "rewind/capture/CaptureCommand.hpp"
#include "rewind/util/Logger.hpp"

namespace rwd::runtime {

using util::Logger;

namespace {

std::string EnvOr(const EnvLookup& env, const char* name, const std::string& fallback) {
  const char* value = env(name);
  return (value != nullptr && value[0] != '\0') ? std::string(value) : fallback;
}

int64_t SecondsToMs(const std::string& text) {
  size_t consumed = 0;
  const double seconds = std::stod(text, &consumed);
  if (consumed != text.size()) {
    throw std::invalid_argument("trailing characters");
  }
  return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

std::filesystem::path Normalized(const std::string& dir) {
  std::filesystem::path p = std::filesystem::path(dir).lexically_normal();
  if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
  return p;
}

bool IsWithin(const std::filesystem::path& inner, const std::filesystem::path& outer) {
  auto i = inner.begin();
  for (auto o = outer.begin(); o != outer.end(); ++o, ++i) {
    if (i == inner.end() || *i != *o) return false;
  }
  return true;
}

// True when one directory is the other or contains it.
bool PathsOverlap(const std::string& a, const std::string& b) {
  const auto pa = Normalized(a);
  const auto pb = Normalized(b);
  return IsWithin(pa, pb) || IsWithin(pb, pa);
}

}  // namespace

EnvLookup SystemEnv() {
  return [](const char* name) -> const char* { return std::getenv(name); };
}

RewindConfig RewindConfig::Defaults(const EnvLookup& env) {
  RewindConfig config;

  const char* runtime_dir = env("XDG_RUNTIME_DIR");
  config.buffer_dir = (runtime_dir != nullptr && runtime_dir[0] != '\0')
                          ? std::string(runtime_dir) + "/rewind/buffer"
                          : "/tmp/rewind/buffer";

  const char* home = env("HOME");
  config.recordings_dir = (home != nullptr && home[0] != '\0')
                              ? std::string(home) + "/Videos/Rewind"
                              : "/tmp/rewind/recordings";

  config.temp_dir = EnvOr(env, "TMPDIR", "/tmp") + "/rewind-export";
  config.capture_args = capture::DefaultCaptureArgs(EnvOr(env, "DISPLAY", ":0"));
  config.encoder_search_dirs = exporter::DefaultEncoderSearchDirs();
  return config;
}

void RewindConfig::ApplyEnvironment(const EnvLookup& env) {
  buffer_dir = EnvOr(env, "REWIND_BUFFER_DIR", buffer_dir);
  recordings_dir = EnvOr(env, "REWIND_RECORDINGS_DIR", recordings_dir);
  listen_address = EnvOr(env, "REWIND_LISTEN", listen_address);
  encoder = EnvOr(env, "REWIND_ENCODER", encoder);
}

void RewindConfig::Validate() const {
  auto fail = [](const std::string& message) {
    throw RewindError(ErrorCode::kInvalidConfig, message);
  };
  if (chunk_duration_ms <= 0) fail("chunk duration must be positive");
  if (buffer_duration_ms <= 0) fail("buffer duration must be positive");
  if (export_window_ms <= 0) fail("export window must be positive");
  if (buffer_duration_ms < chunk_duration_ms) {
    fail("buffer duration (" + std::to_string(buffer_duration_ms) +
         "ms) is shorter than one chunk (" + std::to_string(chunk_duration_ms) +
         "ms)");
  }
  if (buffer_dir.empty()) fail("buffer directory is empty");
  if (recordings_dir.empty()) fail("recordings directory is empty");
  if (PathsOverlap(buffer_dir, recordings_dir)) {
    fail("buffer and recordings directories must be disjoint: " + buffer_dir +
         " vs " + recordings_dir);
  }
  if (capture_program.empty()) fail("capture program is empty");
  if (encoder.empty()) fail("encoder is empty");
  if (container.empty()) fail("container extension is empty");

  if (buffer_duration_ms % chunk_duration_ms != 0) {
    Logger::Warn("[RewindConfig] buffer duration " +
                 std::to_string(buffer_duration_ms) +
                 "ms is not a multiple of the chunk duration " +
                 std::to_string(chunk_duration_ms) + "ms");
  }
}

capture::RecorderSettings RewindConfig::ToRecorderSettings() const {
  capture::RecorderSettings s;
  s.buffer_dir = buffer_dir;
  s.chunk_duration_ms = chunk_duration_ms;
  s.buffer_duration_ms = buffer_duration_ms;
  s.capture_program = capture_program;
  s.capture_args = capture_args;
  s.container = container;
  s.validate_chunks = validate_chunks;
  s.failure_threshold = failure_threshold;
  s.backoff_base_ms = backoff_base_ms;
  s.backoff_max_ms = backoff_max_ms;
  return s;
}

exporter::ExportSettings RewindConfig::ToExportSettings() const {
  exporter::ExportSettings s;
  s.recordings_dir = recordings_dir;
  s.temp_dir = temp_dir;
  s.encoder = encoder;
  s.quality = quality;
  s.container = container;
  return s;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Rolling screen-capture buffer daemon. Records fixed-length chunks,\n"
            << "keeps the most recent ones, and exports the last N seconds on request.\n"
            << "\n"
            << "BUFFER:\n"
            << "  --buffer-dir DIR       Chunk directory (env REWIND_BUFFER_DIR)\n"
            << "  --chunk-seconds S      Chunk length (default: 10)\n"
            << "  --buffer-seconds S     Retention window (default: 120)\n"
            << "  --capture-program P    Capture tool (default: ffmpeg)\n"
            << "  --capture-args ARGS    Argument template; {output} {duration} {duration_ms}\n"
            << "  --container EXT        Chunk and export extension (default: mp4)\n"
            << "  --no-validate-chunks   Accept any non-empty chunk without probing it\n"
            << "\n"
            << "EXPORT:\n"
            << "  --recordings-dir DIR   Export directory (env REWIND_RECORDINGS_DIR)\n"
            << "  --export-seconds S     Default export window (default: 60)\n"
            << "  --encoder P            Merge tool (env REWIND_ENCODER, default: ffmpeg)\n"
            << "  --quality Q            high | medium | low (default: medium)\n"
            << "\n"
            << "CONTROL:\n"
            << "  --listen ADDR          gRPC address (env REWIND_LISTEN, default: 127.0.0.1:50071)\n"
            << "  --no-autostart         Stay idle until a Start request arrives\n"
            << "  --help                 Show this help message\n"
            << "\n";
}

CliArgs ParseArgs(int argc, const char* const argv[], const EnvLookup& env) {
  CliArgs args;
  args.config = RewindConfig::Defaults(env);
  args.config.ApplyEnvironment(env);
  RewindConfig& c = args.config;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    try {
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--buffer-dir" && has_value) {
        c.buffer_dir = argv[++i];
      } else if (arg == "--recordings-dir" && has_value) {
        c.recordings_dir = argv[++i];
      } else if (arg == "--chunk-seconds" && has_value) {
        c.chunk_duration_ms = SecondsToMs(argv[++i]);
      } else if (arg == "--buffer-seconds" && has_value) {
        c.buffer_duration_ms = SecondsToMs(argv[++i]);
      } else if (arg == "--export-seconds" && has_value) {
        c.export_window_ms = SecondsToMs(argv[++i]);
      } else if (arg == "--capture-program" && has_value) {
        c.capture_program = argv[++i];
      } else if (arg == "--capture-args" && has_value) {
        c.capture_args = capture::SplitArgs(argv[++i]);
      } else if (arg == "--encoder" && has_value) {
        c.encoder = argv[++i];
      } else if (arg == "--quality" && has_value) {
        const std::string name = argv[++i];
        const auto quality = exporter::ParseQuality(name);
        if (!quality) {
          args.error = "Unknown quality: " + name + " (expected high, medium or low)";
          return args;
        }
        c.quality = *quality;
      } else if (arg == "--container" && has_value) {
        c.container = argv[++i];
      } else if (arg == "--no-validate-chunks") {
        c.validate_chunks = false;
      } else if (arg == "--listen" && has_value) {
        c.listen_address = argv[++i];
      } else if (arg == "--no-autostart") {
        c.autostart = false;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    } catch (const std::logic_error&) {
      // std::stod reports malformed numbers as invalid_argument/out_of_range.
      args.error = "Invalid number for " + arg + ": " + argv[i];
      return args;
    }
  }

  args.valid = true;
  return args;
}

}  // namespace rwd::runtime
