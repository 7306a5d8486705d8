// Repository: Rewind
// Component: rewindctl
// Purpose: Command-line client for the RewindControl gRPC service.
// Copyright (c) 2026 Rewind

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "rewind_control.grpc.pb.h"
#include "rewind_control.pb.h"

namespace {

namespace pb = rwd::control;

constexpr int kRpcDeadlineSeconds = 15;

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [--target ADDR] COMMAND\n"
            << "\n"
            << "COMMANDS:\n"
            << "  start              Start the rolling recording\n"
            << "  stop               Stop recording\n"
            << "  export [SECONDS]   Export the last SECONDS (default: daemon setting)\n"
            << "  status             Show recorder and buffer status\n"
            << "  chunks             List buffered chunks\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --target ADDR      Daemon address (env REWIND_LISTEN, default: 127.0.0.1:50071)\n"
            << "  --help             Show this help message\n";
}

// 3 when the daemon could not be reached, 1 when it rejected the request.
int ReportFailure(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::UNIMPLEMENTED:
      std::cerr << "rpc failed: " << status.error_code() << " "
                << status.error_message() << "\n";
      return 3;
    default:
      std::cerr << status.error_message() << "\n";
      return 1;
  }
}

void SetDeadline(grpc::ClientContext* context) {
  context->set_deadline(std::chrono::system_clock::now() +
                        std::chrono::seconds(kRpcDeadlineSeconds));
}

int RunStart(pb::RewindControl::Stub* stub) {
  grpc::ClientContext context;
  SetDeadline(&context);
  pb::StartResponse response;
  const grpc::Status status = stub->Start(&context, pb::StartRequest(), &response);
  if (!status.ok()) return ReportFailure(status);
  std::cout << "state: " << response.state() << "\n";
  return 0;
}

int RunStop(pb::RewindControl::Stub* stub) {
  grpc::ClientContext context;
  SetDeadline(&context);
  pb::StopResponse response;
  const grpc::Status status = stub->Stop(&context, pb::StopRequest(), &response);
  if (!status.ok()) return ReportFailure(status);
  std::cout << "state: " << response.state() << "\n";
  return response.success() ? 0 : 1;
}

int RunExport(pb::RewindControl::Stub* stub, double window_seconds) {
  // No deadline: the merge runs as long as the encoder needs.
  grpc::ClientContext context;
  pb::ExportLastRequest request;
  request.set_window_seconds(window_seconds);
  pb::ExportLastResponse response;
  const grpc::Status status = stub->ExportLast(&context, request, &response);
  if (!status.ok()) return ReportFailure(status);
  std::cout << response.path() << "\n"
            << "  duration_ms: " << response.duration_ms() << "\n"
            << "  size_bytes:  " << response.size_bytes() << "\n"
            << "  chunks:      " << response.chunk_count() << "\n";
  return 0;
}

int RunStatus(pb::RewindControl::Stub* stub) {
  grpc::ClientContext context;
  SetDeadline(&context);
  pb::StatusResponse r;
  const grpc::Status status = stub->GetStatus(&context, pb::StatusRequest(), &r);
  if (!status.ok()) return ReportFailure(status);
  std::cout << "state:                " << r.state() << "\n"
            << "chunks:               " << r.chunk_count() << "\n"
            << "buffered_ms:          " << r.buffered_ms() << "\n"
            << "buffered_bytes:       " << r.buffered_bytes() << "\n"
            << "iterations:           " << r.iterations() << "\n"
            << "chunks_recorded:      " << r.chunks_recorded() << "\n"
            << "chunks_discarded:     " << r.chunks_discarded() << "\n"
            << "consecutive_failures: " << r.consecutive_failures() << "\n"
            << "backoffs:             " << r.backoffs() << "\n"
            << "export_in_progress:   " << (r.export_in_progress() ? "yes" : "no") << "\n";
  return 0;
}

int RunChunks(pb::RewindControl::Stub* stub) {
  grpc::ClientContext context;
  SetDeadline(&context);
  pb::ListChunksResponse response;
  const grpc::Status status =
      stub->ListChunks(&context, pb::ListChunksRequest(), &response);
  if (!status.ok()) return ReportFailure(status);
  for (const auto& c : response.chunks()) {
    std::cout << c.created_at_iso() << "  " << c.size_bytes() << "  " << c.path()
              << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  const char* env_target = std::getenv("REWIND_LISTEN");
  std::string target = (env_target && env_target[0]) ? env_target : "127.0.0.1:50071";

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg == "--target" && i + 1 < argc) {
      target = argv[++i];
    } else {
      break;
    }
  }
  if (i >= argc) {
    PrintUsage(argv[0]);
    return 2;
  }

  const std::string command = argv[i];
  auto channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
  auto stub = pb::RewindControl::NewStub(channel);

  if (command == "start") return RunStart(stub.get());
  if (command == "stop") return RunStop(stub.get());
  if (command == "status") return RunStatus(stub.get());
  if (command == "chunks") return RunChunks(stub.get());
  if (command == "export") {
    double seconds = 0;
    if (i + 1 < argc) {
      char* end = nullptr;
      seconds = std::strtod(argv[i + 1], &end);
      if (end == argv[i + 1] || *end != '\0' || seconds <= 0) {
        std::cerr << "Error: invalid export window: " << argv[i + 1] << "\n";
        return 2;
      }
    }
    return RunExport(stub.get(), seconds);
  }

  std::cerr << "Error: unknown command: " << command << "\n\n";
  PrintUsage(argv[0]);
  return 2;
}
