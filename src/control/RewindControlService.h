// Repository: Rewind
// Component: RewindControl gRPC Service Implementation
// Purpose: Implements the RewindControl service on top of the recording core.
// Copyright (c) 2026 Rewind

#ifndef REWIND_CONTROL_REWIND_CONTROL_SERVICE_H_
#define REWIND_CONTROL_REWIND_CONTROL_SERVICE_H_

#include <cstdint>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "rewind_control.grpc.pb.h"
#include "rewind_control.pb.h"
#include "rewind/buffer/BufferStore.hpp"
#include "rewind/exporter/ExportCoordinator.hpp"
#include "rewind/runtime/RecordingController.hpp"

namespace rwd::control {

// RewindControlImpl is a thin adapter over RecordingController,
// ExportCoordinator and BufferStore. A failed Start or ExportLast sets
// success=false and returns a non-OK status whose message is the error's
// what() (code name, message, then any encoder diagnostics).
class RewindControlImpl final : public RewindControl::Service {
 public:
  RewindControlImpl(std::shared_ptr<runtime::RecordingController> controller,
                    std::shared_ptr<exporter::ExportCoordinator> exporter,
                    std::shared_ptr<buffer::BufferStore> store,
                    int64_t default_export_window_ms);
  ~RewindControlImpl() override;

  RewindControlImpl(const RewindControlImpl&) = delete;
  RewindControlImpl& operator=(const RewindControlImpl&) = delete;

  grpc::Status Start(grpc::ServerContext* context, const StartRequest* request,
                     StartResponse* response) override;

  grpc::Status Stop(grpc::ServerContext* context, const StopRequest* request,
                    StopResponse* response) override;

  // Blocks for the duration of the merge.
  grpc::Status ExportLast(grpc::ServerContext* context,
                          const ExportLastRequest* request,
                          ExportLastResponse* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const StatusRequest* request,
                         StatusResponse* response) override;

  grpc::Status ListChunks(grpc::ServerContext* context,
                          const ListChunksRequest* request,
                          ListChunksResponse* response) override;

 private:
  std::shared_ptr<runtime::RecordingController> controller_;
  std::shared_ptr<exporter::ExportCoordinator> exporter_;
  std::shared_ptr<buffer::BufferStore> store_;
  const int64_t default_export_window_ms_;
};

}  // namespace rwd::control

#endif  // REWIND_CONTROL_REWIND_CONTROL_SERVICE_H_
