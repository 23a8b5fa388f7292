#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "chartsync/v1.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/record_engine.hpp"
#include "internal/remote/grpc_remote_transport.hpp"
#include "internal/remote/grpc_status.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace chartsync::v1;
using chartsync::sync::upload::LocalChangesFetchMode;
using chartsync::sync::upload::UploadErrorCode;

Resource MakePatient(const std::string& id, const std::string& version = "") {
  Resource r;
  r.set_type(RESOURCE_TYPE_PATIENT);
  r.set_logical_id(id);
  r.set_version_id(version);
  return r;
}

// In-process stand-in for the remote record server.
class FakeRemoteStore final : public RemoteStoreService::Service {
 public:
  std::vector<ResourceBatch> batches;
  std::vector<std::string>   uploaded;
  std::atomic<bool>          saw_since{false};
  // keep the stream open after the last batch until the client cancels
  std::atomic<bool>          hold_open{false};

  ::grpc::Status Download(::grpc::ServerContext* ctx, const DownloadRequest* request,
                          ::grpc::ServerWriter<ResourceBatch>* writer) override {
    saw_since = request->has_since();
    for (const auto& batch : batches) {
      writer->Write(batch);
    }
    while (hold_open && !ctx->IsCancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return ::grpc::Status::OK;
  }

  ::grpc::Status Upload(::grpc::ServerContext*, const UploadRequest* request, UploadResponse* response) override {
    const auto& change = request->change();
    if (change.resource_id() == "reject-me") {
      return ToStatusFor(chartsync::util::InvalidState("missing required field"));
    }

    std::lock_guard lock(mutex_);
    uploaded.push_back(change.resource_id());
    if (change.type() != CHANGE_TYPE_DELETE) {
      *response->mutable_resource() = change.payload();
      response->mutable_resource()->set_version_id("srv-" + std::to_string(uploaded.size()));
    }
    return ::grpc::Status::OK;
  }

 private:
  static ::grpc::Status ToStatusFor(const std::exception& e) {
    return chartsync::remote::ToStatus(e);
  }

  std::mutex mutex_;
};

struct Harness {
  FakeRemoteStore                 service;
  std::unique_ptr<::grpc::Server> server;

  std::shared_ptr<chartsync::store::RecordStore> store =
      std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  chartsync::engine::RecordEngine engine{store};

  Harness() {
    ::grpc::ServerBuilder builder;
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
  }

  ~Harness() {
    server->Shutdown();
  }

  chartsync::remote::GrpcRemoteTransport Transport() {
    return chartsync::remote::GrpcRemoteTransport(server->InProcessChannel(::grpc::ChannelArguments()), {5'000, 10});
  }
};

void TestDownloadStreamsBatchesIntoTheStore() {
  Harness h;
  ResourceBatch first;
  *first.add_resources() = MakePatient("p1", "1");
  *first.add_resources() = MakePatient("p2", "1");
  ResourceBatch second;
  *second.add_resources() = MakePatient("p3", "4");
  h.service.batches = {first, second};

  auto transport = h.Transport();
  auto source    = transport.OpenDownload(std::nullopt);
  const auto summary = h.engine.SyncDownload(chartsync::sync::AcceptRemoteConflictResolver(), *source);

  assert(summary.batches == 2);
  assert(summary.resources == 3);
  assert(!h.service.saw_since);
  assert(h.engine.Get(RESOURCE_TYPE_PATIENT, "p3").version_id() == "4");

  auto again = transport.OpenDownload(chartsync::util::Now());
  while (again->Next()) {
  }
  assert(h.service.saw_since);
}

void TestCancelUnblocksPendingRead() {
  Harness h;
  ResourceBatch only;
  *only.add_resources() = MakePatient("p1", "1");
  h.service.batches   = {only};
  h.service.hold_open = true;

  auto transport = h.Transport();
  auto source    = transport.OpenDownload(std::nullopt);
  assert(source->Next().has_value());

  std::atomic<bool> returned{false};
  bool              ended = false;
  std::thread       reader([&] {
    ended    = !source->Next().has_value();
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!returned);
  source->Cancel();
  reader.join();

  assert(ended);
  assert(!source->Next().has_value());
}

void TestUploadRoundTrip() {
  Harness h;
  h.engine.Create({MakePatient("p1"), MakePatient("p2")});

  auto transport = h.Transport();
  auto flow      = h.engine.SyncUpload(LocalChangesFetchMode::kPerResource, transport.MakeUploadFn());

  uint64_t last_remaining = 0;
  while (auto progress = flow->Next()) {
    assert(!progress->upload_error.has_value());
    last_remaining = progress->remaining;
  }

  assert(last_remaining == 0);
  assert(h.service.uploaded.size() == 2);
  assert(h.engine.GetUnsyncedLocalChanges().empty());
  assert(h.engine.Get(RESOURCE_TYPE_PATIENT, "p1").version_id() == "srv-1");
  assert(h.engine.Get(RESOURCE_TYPE_PATIENT, "p2").version_id() == "srv-2");
}

void TestRejectedUploadStopsAndKeepsJournal() {
  Harness h;
  h.engine.Create({MakePatient("reject-me"), MakePatient("z-later")});

  auto transport = h.Transport();
  auto flow      = h.engine.SyncUpload(LocalChangesFetchMode::kAllChanges, transport.MakeUploadFn());

  std::optional<chartsync::sync::upload::UploadError> error;
  while (auto progress = flow->Next()) {
    if (progress->upload_error) error = progress->upload_error;
  }

  assert(error.has_value());
  assert(error->code == UploadErrorCode::kRejected);
  assert(h.service.uploaded.empty());
  assert(h.engine.GetUnsyncedLocalChanges().size() == 2);
}

void TestStatusMapping() {
  assert(chartsync::remote::ToUploadError(::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "down")).code ==
         UploadErrorCode::kTransport);
  assert(chartsync::remote::ToUploadError(::grpc::Status(::grpc::StatusCode::ABORTED, "stale")).code == UploadErrorCode::kConflict);
  assert(chartsync::remote::ToUploadError(::grpc::Status(::grpc::StatusCode::INTERNAL, "boom")).code == UploadErrorCode::kUnknown);

  assert(chartsync::remote::ToStatus(chartsync::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(chartsync::remote::ToStatus(chartsync::util::TransactionFailure("x")).error_code() == ::grpc::StatusCode::ABORTED);
}

} // namespace

int main() {
  TestDownloadStreamsBatchesIntoTheStore();
  TestCancelUnblocksPendingRead();
  TestUploadRoundTrip();
  TestRejectedUploadStopsAndKeepsJournal();
  TestStatusMapping();

  std::cout << "chartsync_unit_grpc_remote_transport: pass\n";
  return 0;
}
