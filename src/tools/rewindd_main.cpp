// Repository: Rewind
// Component: rewindd
// Purpose: Daemon entry point: wires the recording core and serves RewindControl.
// Copyright (c) 2026 Rewind

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "control/RewindControlService.h"
#include "rewind/RewindError.hpp"
#include "rewind/buffer/BufferStore.hpp"
#include "rewind/capture/ChunkRecorder.hpp"
#include "rewind/exporter/ExportCoordinator.hpp"
#include "rewind/fs/IFileOps.hpp"
#include "rewind/media/MediaProbe.hpp"
#include "rewind/process/PosixProcessGateway.hpp"
#include "rewind/runtime/RecordingController.hpp"
#include "rewind/runtime/RewindConfig.hpp"
#include "rewind/time/SystemTimeSource.hpp"
#include "rewind/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using rwd::util::Logger;
  namespace runtime = rwd::runtime;

  runtime::CliArgs args = runtime::ParseArgs(argc, argv, runtime::SystemEnv());
  if (args.help) {
    runtime::PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    runtime::PrintUsage(argv[0]);
    return 1;
  }

  const runtime::RewindConfig& config = args.config;
  try {
    config.Validate();
  } catch (const rwd::RewindError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // Broken pipes surface as EPIPE.
  std::signal(SIGPIPE, SIG_IGN);

  auto files = std::make_shared<rwd::fs::PosixFileOps>();
  auto gateway =
      std::make_shared<rwd::process::PosixProcessGateway>(config.encoder_search_dirs);
  auto clock = std::make_shared<rwd::time::SystemTimeSource>();
  auto probe = std::make_shared<rwd::media::FFmpegMediaProbe>();
  auto store = std::make_shared<rwd::buffer::BufferStore>(files);

  auto recorder = std::make_shared<rwd::capture::ChunkRecorder>(
      config.ToRecorderSettings(), gateway, store, files, clock,
      config.validate_chunks ? probe : nullptr);
  auto exporter = std::make_shared<rwd::exporter::ExportCoordinator>(
      config.ToExportSettings(), gateway, store, files, clock, probe);
  auto controller = std::make_shared<runtime::RecordingController>(
      recorder, store, gateway, exporter);

  rwd::control::RewindControlImpl service(controller, exporter, store,
                                             config.export_window_ms);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[rewindd] failed to listen on " + config.listen_address);
    return 1;
  }
  Logger::Info("[rewindd] RewindControl listening on " + config.listen_address +
               " buffer=" + config.buffer_dir +
               " recordings=" + config.recordings_dir);

  if (config.autostart) {
    try {
      controller->Start();
    } catch (const rwd::RewindError& e) {
      // Stay up and idle; a later Start request may succeed.
      Logger::Error(std::string("[rewindd] autostart failed: ") + e.what());
    }
  }

  std::thread server_thread([&server] { server->Wait(); });

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  Logger::Info("[rewindd] termination requested, shutting down");
  controller->Stop();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  server_thread.join();
  Logger::Info("[rewindd] exited cleanly");
  return 0;
}
