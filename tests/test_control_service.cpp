// Repository: Rewind
// Component: RewindControl service tests
// Purpose: RPC handlers invoked directly against fakes; error mapping into
//          responses.
// Copyright (c) 2026 Rewind

#include <gtest/gtest.h>
#include <google/protobuf/descriptor.h>

#include <chrono>
#include <limits>
#include <memory>
#include <string>

#include "control/RewindControlService.h"
#include "fixtures/FakeFileOps.h"
#include "fixtures/FakeProcessGateway.h"
#include "rewind/buffer/BufferStore.hpp"
#include "rewind/capture/ChunkRecorder.hpp"
#include "rewind/exporter/ExportCoordinator.hpp"
#include "rewind/runtime/RecordingController.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace rwd::control {
namespace {

using rwd::process::LaunchSpec;
using rwd::process::ProcessResult;
using rwd::tests::DeterministicTimeSource;
using rwd::tests::fixtures::FakeFileOps;
using rwd::tests::fixtures::FakeProcessGateway;

class RewindControlServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    files_ = std::make_shared<FakeFileOps>();
    capture_gateway_ = std::make_shared<FakeProcessGateway>();
    capture_gateway_->SetHoldHandles(true);
    merge_gateway_ = std::make_shared<FakeProcessGateway>();
    store_ = std::make_shared<buffer::BufferStore>(files_);
    clock_ = std::make_shared<DeterministicTimeSource>();

    capture::RecorderSettings rs;
    rs.buffer_dir = "/buf";
    rs.capture_program = "ffmpeg";
    rs.capture_args = {"{output}"};
    rs.validate_chunks = false;
    auto recorder = std::make_shared<capture::ChunkRecorder>(
        rs, capture_gateway_, store_, files_, clock_, nullptr);

    exporter::ExportSettings es;
    es.recordings_dir = "/recordings";
    es.temp_dir = "/tmp/rewind-export";
    exporter_ = std::make_shared<exporter::ExportCoordinator>(
        es, merge_gateway_, store_, files_, clock_, nullptr);

    controller_ = std::make_shared<runtime::RecordingController>(
        recorder, store_, capture_gateway_, exporter_);
    service_ = std::make_unique<RewindControlImpl>(controller_, exporter_, store_,
                                                   60'000);
  }

  void TearDown() override {
    service_.reset();
    controller_->Stop();
  }

  buffer::Chunk AddAged(int64_t age_ms) {
    buffer::Chunk c;
    c.id = buffer::GenerateChunkId();
    c.created_at_ms = clock_->NowUtcMs() - age_ms;
    c.path = buffer::ChunkPathFor("/buf", c.created_at_ms, "mp4");
    c.duration_ms = 10'000;
    c.size_bytes = 500;
    files_->Put(c.path, c.size_bytes);
    store_->Add(c);
    return c;
  }

  std::shared_ptr<FakeFileOps> files_;
  std::shared_ptr<FakeProcessGateway> capture_gateway_;
  std::shared_ptr<FakeProcessGateway> merge_gateway_;
  std::shared_ptr<buffer::BufferStore> store_;
  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<exporter::ExportCoordinator> exporter_;
  std::shared_ptr<runtime::RecordingController> controller_;
  std::unique_ptr<RewindControlImpl> service_;
};

TEST_F(RewindControlServiceTest, StartAndStopReportState) {
  StartRequest start_req;
  StartResponse start_resp;
  ASSERT_TRUE(service_->Start(nullptr, &start_req, &start_resp).ok());
  EXPECT_TRUE(start_resp.success());
  EXPECT_EQ(start_resp.state(), "recording");

  StartResponse again;
  ASSERT_TRUE(service_->Start(nullptr, &start_req, &again).ok());
  EXPECT_TRUE(again.success());
  EXPECT_EQ(again.state(), "recording");

  StopRequest stop_req;
  StopResponse stop_resp;
  ASSERT_TRUE(service_->Stop(nullptr, &stop_req, &stop_resp).ok());
  EXPECT_TRUE(stop_resp.success());
  EXPECT_EQ(stop_resp.state(), "idle");
}

TEST_F(RewindControlServiceTest, StartFailureIsReportedInResponse) {
  capture_gateway_->MarkMissing("ffmpeg");
  StartRequest req;
  StartResponse resp;
  const grpc::Status status = service_->Start(nullptr, &req, &resp);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(status.error_message().rfind("CAPTURE_UNAVAILABLE", 0), 0u);
  EXPECT_FALSE(resp.success());
  EXPECT_EQ(resp.state(), "idle");
}

TEST_F(RewindControlServiceTest, ExportLastReturnsArtifact) {
  merge_gateway_->SetScript([this](const LaunchSpec& spec, int) {
    files_->Put(spec.args.back(), 4'096);
    ProcessResult r;
    r.exit_code = 0;
    return r;
  });
  const auto a = AddAged(25'000);
  const auto b = AddAged(5'000);

  ExportLastRequest req;
  req.set_window_seconds(30);
  ExportLastResponse resp;
  ASSERT_TRUE(service_->ExportLast(nullptr, &req, &resp).ok());
  ASSERT_TRUE(resp.success()) << resp.message();
  EXPECT_EQ(resp.chunk_count(), 2u);
  ASSERT_EQ(resp.chunk_ids_size(), 2);
  EXPECT_EQ(resp.chunk_ids(0), a.id);
  EXPECT_EQ(resp.chunk_ids(1), b.id);
  EXPECT_EQ(resp.size_bytes(), 4'096u);
  EXPECT_EQ(resp.duration_ms(), 20'000);
  EXPECT_EQ(resp.created_at_utc_ms(), clock_->NowUtcMs());
  EXPECT_FALSE(resp.path().empty());
}

TEST_F(RewindControlServiceTest, ExportLastUsesDefaultWindowWhenUnset) {
  merge_gateway_->SetScript([this](const LaunchSpec& spec, int) {
    files_->Put(spec.args.back(), 1);
    ProcessResult r;
    r.exit_code = 0;
    return r;
  });
  AddAged(90'000);
  const auto recent = AddAged(50'000);

  ExportLastRequest req;  // window_seconds = 0
  ExportLastResponse resp;
  ASSERT_TRUE(service_->ExportLast(nullptr, &req, &resp).ok());
  ASSERT_TRUE(resp.success());
  ASSERT_EQ(resp.chunk_ids_size(), 1);
  EXPECT_EQ(resp.chunk_ids(0), recent.id);
}

TEST_F(RewindControlServiceTest, ExportLastOnEmptyBufferReportsNoChunks) {
  ExportLastRequest req;
  req.set_window_seconds(60);
  ExportLastResponse resp;
  const grpc::Status status = service_->ExportLast(nullptr, &req, &resp);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(status.error_message().rfind("NO_CHUNKS_AVAILABLE", 0), 0u);
  EXPECT_FALSE(resp.success());
  EXPECT_EQ(merge_gateway_->LaunchCount(), 0);
}

TEST_F(RewindControlServiceTest, ExportLastRejectsNonFiniteOrHugeWindows) {
  AddAged(5'000);
  for (double window : {std::numeric_limits<double>::quiet_NaN(),
                        std::numeric_limits<double>::infinity(),
                        -std::numeric_limits<double>::infinity(), 1e300}) {
    ExportLastRequest req;
    req.set_window_seconds(window);
    ExportLastResponse resp;
    const grpc::Status status = service_->ExportLast(nullptr, &req, &resp);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT) << window;
    EXPECT_FALSE(resp.success());
  }
  EXPECT_EQ(merge_gateway_->LaunchCount(), 0);
}

TEST_F(RewindControlServiceTest, ResponseFieldsAreNumberedContiguously) {
  const auto* desc = ExportLastResponse::descriptor();
  ASSERT_EQ(desc->field_count(), 8);
  for (int i = 0; i < desc->field_count(); ++i) {
    EXPECT_EQ(desc->field(i)->number(), i + 1) << desc->field(i)->name();
  }
  EXPECT_EQ(StartResponse::descriptor()->FindFieldByName("state")->number(), 3);
  EXPECT_EQ(StopResponse::descriptor()->FindFieldByName("state")->number(), 3);
}

TEST_F(RewindControlServiceTest, MergeFailureCarriesDiagnostics) {
  merge_gateway_->SetScript([](const LaunchSpec&, int) {
    ProcessResult r;
    r.exit_code = 1;
    r.stderr_text = "Invalid data found when processing input\n";
    return r;
  });
  AddAged(5'000);

  ExportLastRequest req;
  req.set_window_seconds(60);
  ExportLastResponse resp;
  const grpc::Status status = service_->ExportLast(nullptr, &req, &resp);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
  EXPECT_EQ(status.error_message().rfind("MERGE_FAILED", 0), 0u);
  EXPECT_NE(status.error_message().find("Invalid data found when processing input"),
            std::string::npos);
  EXPECT_FALSE(resp.success());
  EXPECT_EQ(store_->Size(), 1u);
}

TEST_F(RewindControlServiceTest, StatusAndListReflectBuffer) {
  const auto older = AddAged(40'000);
  const auto newer = AddAged(10'000);

  StatusRequest status_req;
  StatusResponse status;
  ASSERT_TRUE(service_->GetStatus(nullptr, &status_req, &status).ok());
  EXPECT_EQ(status.state(), "idle");
  EXPECT_EQ(status.chunk_count(), 2u);
  EXPECT_EQ(status.oldest_chunk_utc_ms(), older.created_at_ms);
  EXPECT_EQ(status.newest_chunk_utc_ms(), newer.created_at_ms);
  EXPECT_EQ(status.buffered_ms(), 20'000);
  EXPECT_EQ(status.buffered_bytes(), 1'000u);
  EXPECT_FALSE(status.export_in_progress());
  EXPECT_EQ(status.start_total(), 0u);

  ListChunksRequest list_req;
  ListChunksResponse list;
  ASSERT_TRUE(service_->ListChunks(nullptr, &list_req, &list).ok());
  ASSERT_EQ(list.chunks_size(), 2);
  EXPECT_EQ(list.chunks(0).id(), older.id);
  EXPECT_EQ(list.chunks(1).id(), newer.id);
  EXPECT_EQ(list.chunks(1).path(), newer.path);
  EXPECT_FALSE(list.chunks(0).created_at_iso().empty());
}

TEST_F(RewindControlServiceTest, StatusCountsTransitions) {
  StartRequest start_req;
  StartResponse start_resp;
  ASSERT_TRUE(service_->Start(nullptr, &start_req, &start_resp).ok());
  StopRequest stop_req;
  StopResponse stop_resp;
  ASSERT_TRUE(service_->Stop(nullptr, &stop_req, &stop_resp).ok());

  StatusRequest req;
  StatusResponse status;
  ASSERT_TRUE(service_->GetStatus(nullptr, &req, &status).ok());
  EXPECT_EQ(status.start_total(), 1u);
  EXPECT_EQ(status.stop_total(), 1u);
}

}  // namespace
}  // namespace rwd::control
