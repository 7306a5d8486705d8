// Repository: Rewind
// Component: Daemon configuration tests
// Purpose: Defaults, environment overrides, flag parsing and validation.
// Copyright (c) 2026 Rewind

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "rewind/RewindError.hpp"
#include "rewind/runtime/RewindConfig.hpp"
#include "rewind/util/Logger.hpp"

namespace rwd::runtime {
namespace {

class FakeEnv {
 public:
  FakeEnv() = default;
  explicit FakeEnv(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}

  EnvLookup Lookup() const {
    return [this](const char* name) -> const char* {
      auto it = vars_.find(name);
      return it == vars_.end() ? nullptr : it->second.c_str();
    };
  }

 private:
  std::map<std::string, std::string> vars_;
};

CliArgs Parse(const std::vector<const char*>& flags, const FakeEnv& env) {
  std::vector<const char*> argv = {"rewindd"};
  argv.insert(argv.end(), flags.begin(), flags.end());
  return ParseArgs(static_cast<int>(argv.size()), argv.data(), env.Lookup());
}

// -----------------------------------------------------------------------------
// Defaults
// -----------------------------------------------------------------------------
TEST(RewindConfigTest, DefaultsFollowUserDirectories) {
  const FakeEnv env({{"XDG_RUNTIME_DIR", "/run/user/1000"},
                     {"HOME", "/home/ana"},
                     {"TMPDIR", "/var/tmp"},
                     {"DISPLAY", ":1"}});
  const RewindConfig c = RewindConfig::Defaults(env.Lookup());
  EXPECT_EQ(c.buffer_dir, "/run/user/1000/rewind/buffer");
  EXPECT_EQ(c.recordings_dir, "/home/ana/Videos/Rewind");
  EXPECT_EQ(c.temp_dir, "/var/tmp/rewind-export");
  EXPECT_EQ(c.chunk_duration_ms, 10'000);
  EXPECT_EQ(c.buffer_duration_ms, 120'000);
  EXPECT_EQ(c.export_window_ms, 60'000);
  EXPECT_EQ(c.quality, exporter::ExportQuality::kMedium);
  EXPECT_EQ(c.listen_address, "127.0.0.1:50071");
  EXPECT_TRUE(c.autostart);
  EXPECT_NE(std::find(c.capture_args.begin(), c.capture_args.end(), ":1"),
            c.capture_args.end());
  EXPECT_NO_THROW(c.Validate());
}

TEST(RewindConfigTest, DefaultsWithEmptyEnvironmentUseTmp) {
  const FakeEnv env;
  const RewindConfig c = RewindConfig::Defaults(env.Lookup());
  EXPECT_EQ(c.buffer_dir, "/tmp/rewind/buffer");
  EXPECT_EQ(c.recordings_dir, "/tmp/rewind/recordings");
  EXPECT_EQ(c.temp_dir, "/tmp/rewind-export");
  EXPECT_NE(std::find(c.capture_args.begin(), c.capture_args.end(), ":0"),
            c.capture_args.end());
}

TEST(RewindConfigTest, EnvironmentOverridesDefaults) {
  const FakeEnv env({{"HOME", "/home/ana"},
                     {"REWIND_BUFFER_DIR", "/dev/shm/rw"},
                     {"REWIND_RECORDINGS_DIR", "/data/clips"},
                     {"REWIND_LISTEN", "unix:/run/rewind.sock"},
                     {"REWIND_ENCODER", "/opt/ffmpeg/bin/ffmpeg"}});
  const CliArgs args = Parse({}, env);
  ASSERT_TRUE(args.valid);
  EXPECT_EQ(args.config.buffer_dir, "/dev/shm/rw");
  EXPECT_EQ(args.config.recordings_dir, "/data/clips");
  EXPECT_EQ(args.config.listen_address, "unix:/run/rewind.sock");
  EXPECT_EQ(args.config.encoder, "/opt/ffmpeg/bin/ffmpeg");
}

// -----------------------------------------------------------------------------
// Flags
// -----------------------------------------------------------------------------
TEST(RewindConfigTest, FlagsOverrideEnvironment) {
  const FakeEnv env(std::map<std::string, std::string>{{"REWIND_BUFFER_DIR", "/env/buf"}});
  const CliArgs args = Parse({"--buffer-dir", "/flag/buf",
                              "--recordings-dir", "/flag/rec",
                              "--chunk-seconds", "5",
                              "--buffer-seconds", "30",
                              "--export-seconds", "12.5",
                              "--quality", "high",
                              "--capture-args", "-f x11grab -t {duration} {output}",
                              "--container", "mkv",
                              "--no-validate-chunks",
                              "--no-autostart",
                              "--listen", "0.0.0.0:6000"},
                             env);
  ASSERT_TRUE(args.valid) << args.error;
  const RewindConfig& c = args.config;
  EXPECT_EQ(c.buffer_dir, "/flag/buf");
  EXPECT_EQ(c.recordings_dir, "/flag/rec");
  EXPECT_EQ(c.chunk_duration_ms, 5'000);
  EXPECT_EQ(c.buffer_duration_ms, 30'000);
  EXPECT_EQ(c.export_window_ms, 12'500);
  EXPECT_EQ(c.quality, exporter::ExportQuality::kHigh);
  EXPECT_EQ(c.capture_args,
            (std::vector<std::string>{"-f", "x11grab", "-t", "{duration}", "{output}"}));
  EXPECT_EQ(c.container, "mkv");
  EXPECT_FALSE(c.validate_chunks);
  EXPECT_FALSE(c.autostart);
  EXPECT_EQ(c.listen_address, "0.0.0.0:6000");

  const auto recorder = c.ToRecorderSettings();
  EXPECT_EQ(recorder.buffer_dir, "/flag/buf");
  EXPECT_EQ(recorder.chunk_duration_ms, 5'000);
  EXPECT_EQ(recorder.container, "mkv");
  EXPECT_FALSE(recorder.validate_chunks);

  const auto export_settings = c.ToExportSettings();
  EXPECT_EQ(export_settings.recordings_dir, "/flag/rec");
  EXPECT_EQ(export_settings.quality, exporter::ExportQuality::kHigh);
  EXPECT_EQ(export_settings.container, "mkv");
}

TEST(RewindConfigTest, HelpStopsParsing) {
  const CliArgs args = Parse({"--help", "--bogus"}, FakeEnv());
  EXPECT_TRUE(args.help);
  EXPECT_TRUE(args.valid);
}

TEST(RewindConfigTest, RejectsUnknownAndMalformedFlags) {
  const FakeEnv env;

  CliArgs args = Parse({"--frobnicate"}, env);
  EXPECT_FALSE(args.valid);
  EXPECT_NE(args.error.find("--frobnicate"), std::string::npos);

  args = Parse({"--chunk-seconds", "ten"}, env);
  EXPECT_FALSE(args.valid);
  EXPECT_NE(args.error.find("Invalid number"), std::string::npos);

  args = Parse({"--buffer-seconds", "30s"}, env);
  EXPECT_FALSE(args.valid);

  args = Parse({"--quality", "ultra"}, env);
  EXPECT_FALSE(args.valid);
  EXPECT_NE(args.error.find("ultra"), std::string::npos);

  args = Parse({"--buffer-dir"}, env);  // missing value
  EXPECT_FALSE(args.valid);
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
class RewindConfigValidateTest : public ::testing::Test {
 protected:
  void SetUp() override { config_ = RewindConfig::Defaults(FakeEnv().Lookup()); }
  void TearDown() override {
    util::Logger::SetSink(util::Logger::Level::kWarn, nullptr);
  }

  void ExpectInvalid() {
    try {
      config_.Validate();
      FAIL() << "expected RewindError";
    } catch (const RewindError& e) {
      EXPECT_EQ(e.code(), ErrorCode::kInvalidConfig);
    }
  }

  RewindConfig config_;
};

TEST_F(RewindConfigValidateTest, RejectsNonPositiveDurations) {
  config_.chunk_duration_ms = 0;
  ExpectInvalid();
  config_.chunk_duration_ms = 10'000;
  config_.buffer_duration_ms = -1;
  ExpectInvalid();
  config_.buffer_duration_ms = 120'000;
  config_.export_window_ms = 0;
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, RejectsBufferShorterThanChunk) {
  config_.chunk_duration_ms = 10'000;
  config_.buffer_duration_ms = 5'000;
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, RejectsSharedDirectories) {
  config_.recordings_dir = config_.buffer_dir;
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, RejectsSameDirectorySpelledDifferently) {
  config_.buffer_dir = "/data/rewind/buf";
  config_.recordings_dir = "/data/rewind/buf/";
  ExpectInvalid();
  config_.recordings_dir = "/data/rewind/./clips/../buf";
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, RejectsNestedDirectories) {
  config_.buffer_dir = "/data/rewind/buf";
  config_.recordings_dir = "/data/rewind/buf/exports";
  ExpectInvalid();
  config_.buffer_dir = "/data/rewind/clips/buf";
  config_.recordings_dir = "/data/rewind/clips";
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, AcceptsSiblingsSharingAPrefix) {
  config_.buffer_dir = "/data/rewind/buf";
  config_.recordings_dir = "/data/rewind/buffered";
  EXPECT_NO_THROW(config_.Validate());
}

TEST_F(RewindConfigValidateTest, RejectsEmptyPrograms) {
  config_.capture_program.clear();
  ExpectInvalid();
  config_.capture_program = "ffmpeg";
  config_.encoder.clear();
  ExpectInvalid();
}

TEST_F(RewindConfigValidateTest, WarnsWhenBufferIsNotWholeChunks) {
  std::vector<std::string> warnings;
  util::Logger::SetSink(util::Logger::Level::kWarn,
                        [&](const std::string& line) { warnings.push_back(line); });
  config_.chunk_duration_ms = 7'000;
  config_.buffer_duration_ms = 60'000;
  EXPECT_NO_THROW(config_.Validate());
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("not a multiple"), std::string::npos);
}

}  // namespace
}  // namespace rwd::runtime
