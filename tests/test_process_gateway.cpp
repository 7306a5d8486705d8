// Repository: Rewind
// Component: POSIX process gateway tests
// Purpose: Exit status, stderr capture, cancel, timeout and missing programs
//          against real /bin/sh children.
// Copyright (c) 2026 Rewind

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

#include "rewind/RewindError.hpp"
#include "rewind/process/PosixProcessGateway.hpp"

namespace rwd::process {
namespace {

LaunchSpec Shell(const std::string& script) {
  LaunchSpec spec;
  spec.executable = "/bin/sh";
  spec.args = {"-c", script};
  spec.label = "test";
  return spec;
}

TEST(PosixProcessGatewayTest, ReportsZeroExit) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("exit 0"));
  const ProcessResult r = handle->Wait();
  EXPECT_TRUE(r.Ok());
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_FALSE(r.cancelled);
  EXPECT_TRUE(handle->Finished());
}

TEST(PosixProcessGatewayTest, ReportsNonZeroExitAndStderrVerbatim) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("echo 'moov atom not found' >&2; exit 3"));
  const ProcessResult r = handle->Wait();
  EXPECT_FALSE(r.Ok());
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.stderr_text, "moov atom not found\n");

  try {
    ThrowIfFailed(r, ErrorCode::kMergeFailed, "merge failed");
    FAIL() << "expected RewindError";
  } catch (const RewindError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kMergeFailed);
    EXPECT_EQ(e.diagnostics(), "moov atom not found\n");
  }
}

TEST(PosixProcessGatewayTest, CapturesStdoutOnlyWhenRequested) {
  PosixProcessGateway gateway;
  LaunchSpec spec = Shell("echo hello");
  spec.capture_stdout = true;
  EXPECT_EQ(gateway.Launch(spec)->Wait().stdout_text, "hello\n");

  spec.capture_stdout = false;
  EXPECT_TRUE(gateway.Launch(spec)->Wait().stdout_text.empty());
}

TEST(PosixProcessGatewayTest, WaitIsRepeatable) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("exit 7"));
  EXPECT_EQ(handle->Wait().exit_code, 7);
  EXPECT_EQ(handle->Wait().exit_code, 7);
}

TEST(PosixProcessGatewayTest, CancelInterruptsLongRunningChild) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("exec sleep 30"));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto start = std::chrono::steady_clock::now();
  handle->Cancel();
  const ProcessResult r = handle->Wait();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(r.cancelled);
  EXPECT_FALSE(r.Ok());
  EXPECT_EQ(r.term_signal, SIGINT);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(PosixProcessGatewayTest, CancelIsIdempotentAndSafeAfterExit) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("exit 0"));
  const ProcessResult first = handle->Wait();
  handle->Cancel();
  handle->Cancel();
  const ProcessResult second = handle->Wait();
  EXPECT_TRUE(second.Ok());
  EXPECT_FALSE(second.cancelled);
  EXPECT_EQ(first.exit_code, second.exit_code);
}

TEST(PosixProcessGatewayTest, CancelRacingNaturalExitNeverHangs) {
  PosixProcessGateway gateway;
  for (int i = 0; i < 20; ++i) {
    auto handle = gateway.Launch(Shell("exit 0"));
    std::thread canceller([&] { handle->Cancel(); });
    const ProcessResult r = handle->Wait();
    canceller.join();
    EXPECT_TRUE(r.Ok() || r.cancelled);
  }
}

TEST(PosixProcessGatewayTest, SigintIgnoringChildIsKilledAfterGrace) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("trap '' INT; while :; do sleep 0.05; done"));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  handle->Cancel();
  const ProcessResult r = handle->Wait();
  EXPECT_TRUE(r.cancelled);
  EXPECT_EQ(r.term_signal, SIGKILL);
}

TEST(PosixProcessGatewayTest, TimeoutTerminatesChild) {
  PosixProcessGateway gateway;
  LaunchSpec spec = Shell("exec sleep 30");
  spec.timeout = std::chrono::milliseconds(200);
  const ProcessResult r = gateway.Launch(spec)->Wait();
  EXPECT_TRUE(r.timed_out);
  EXPECT_FALSE(r.cancelled);
  EXPECT_FALSE(r.Ok());
}

TEST(PosixProcessGatewayTest, MissingExecutableRaisesConfiguredError) {
  PosixProcessGateway gateway;
  LaunchSpec spec;
  spec.executable = "/nonexistent/rewind-capture";
  spec.missing_executable_error = ErrorCode::kCaptureUnavailable;
  try {
    gateway.Launch(spec);
    FAIL() << "expected RewindError";
  } catch (const RewindError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kCaptureUnavailable);
  }

  spec.executable = "rewind-no-such-encoder";
  spec.missing_executable_error = ErrorCode::kEncoderNotFound;
  try {
    gateway.Launch(spec);
    FAIL() << "expected RewindError";
  } catch (const RewindError& e) {
    EXPECT_EQ(e.code(), ErrorCode::kEncoderNotFound);
  }
}

TEST(PosixProcessGatewayTest, ResolvesBareNamesThroughSearchDirsAndPath) {
  PosixProcessGateway gateway({"/nonexistent-dir", "/bin"});
  const auto sh = gateway.ResolveExecutable("sh");
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(*sh, "/bin/sh");
  EXPECT_FALSE(gateway.ResolveExecutable("rewind-no-such-tool").has_value());
  EXPECT_FALSE(gateway.ResolveExecutable("").has_value());
  EXPECT_FALSE(gateway.ResolveExecutable("/etc/passwd").has_value());
}

TEST(PosixProcessGatewayTest, DestroyingHandleReapsRunningChild) {
  PosixProcessGateway gateway;
  auto handle = gateway.Launch(Shell("exec sleep 30"));
  const auto start = std::chrono::steady_clock::now();
  handle.reset();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

}  // namespace
}  // namespace rwd::process
