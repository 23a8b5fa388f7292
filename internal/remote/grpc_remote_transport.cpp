#include "grpc_remote_transport.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/grpc_status.hpp"

namespace chartsync::remote {

using namespace chartsync::v1;

namespace {

void ApplyDeadline(::grpc::ClientContext& ctx, uint32_t deadline_ms) {
  if (deadline_ms > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(deadline_ms));
  }
}

class GrpcDownloadSource final : public sync::DownloadSource {
 public:
  GrpcDownloadSource(RemoteStoreService::Stub& stub, const DownloadRequest& request) {
    reader_ = stub.Download(&ctx_, request);
  }

  ~GrpcDownloadSource() override {
    if (!finished_) {
      ctx_.TryCancel();
      ResourceBatch discard;
      while (reader_->Read(&discard)) {
      }
      reader_->Finish();
    }
  }

  std::optional<std::vector<Resource>> Next() override {
    if (finished_) {
      return std::nullopt;
    }

    ResourceBatch batch;
    if (reader_->Read(&batch)) {
      return std::vector<Resource>(batch.resources().begin(), batch.resources().end());
    }

    finished_         = true;
    const auto status = reader_->Finish();
    if (!status.ok() && !(cancelled_ && status.error_code() == ::grpc::StatusCode::CANCELLED)) {
      throw std::runtime_error("download stream failed: " + status.error_message());
    }
    return std::nullopt;
  }

  void Cancel() override {
    cancelled_ = true;
    ctx_.TryCancel();
  }

 private:
  ::grpc::ClientContext                                ctx_;
  std::unique_ptr<::grpc::ClientReader<ResourceBatch>> reader_;
  bool                                                 finished_ = false;
  // set from the consumer thread while Next() blocks on the producer thread
  std::atomic<bool> cancelled_{false};
};

class GrpcUploadResultStream final : public sync::upload::UploadResultStream {
 public:
  GrpcUploadResultStream(std::shared_ptr<RemoteStoreService::Stub> stub, std::vector<LocalChange> changes, uint32_t deadline_ms)
      : stub_(std::move(stub)), changes_(std::move(changes)), deadline_ms_(deadline_ms) {
  }

  std::optional<sync::upload::UploadRequestResult> Next() override {
    if (next_ >= changes_.size()) {
      return std::nullopt;
    }
    const auto& change = changes_[next_++];

    UploadRequest request;
    *request.mutable_change() = change;
    UploadResponse response;

    ::grpc::ClientContext ctx;
    ApplyDeadline(ctx, deadline_ms_);
    const auto status = stub_->Upload(&ctx, request, &response);

    if (!status.ok()) {
      CHARTSYNC_LOG_DEBUG("upload call failed",
                          {observability::StringField("resource",
                                                      chartsync::model::TypeWithId(change.resource_type(), change.resource_id())),
                           observability::IntField("status", static_cast<std::int64_t>(status.error_code()))});
      return sync::upload::UploadFailure{change, ToUploadError(status)};
    }

    sync::upload::UploadSuccess success{change, std::nullopt};
    if (response.has_resource()) {
      success.remote = response.resource();
    }
    return success;
  }

 private:
  std::shared_ptr<RemoteStoreService::Stub> stub_;
  std::vector<LocalChange>                  changes_;
  uint32_t                                  deadline_ms_;
  std::size_t                               next_ = 0;
};

} // namespace

GrpcRemoteTransport::GrpcRemoteTransport(std::shared_ptr<::grpc::Channel> channel, RemoteOptions options)
    : options_(options) {
  if (!channel) {
    throw std::invalid_argument("remote transport requires a channel");
  }
  stub_ = RemoteStoreService::NewStub(channel);
}

std::unique_ptr<sync::DownloadSource> GrpcRemoteTransport::OpenDownload(std::optional<chartsync::util::TimePoint> since) {
  DownloadRequest request;
  if (since) {
    *request.mutable_since() = chartsync::util::ToProto(*since);
  }
  request.set_batch_size(options_.download_batch_size);
  return std::make_unique<GrpcDownloadSource>(*stub_, request);
}

sync::upload::UploadFn GrpcRemoteTransport::MakeUploadFn() {
  auto stub        = stub_;
  auto deadline_ms = options_.deadline_ms;
  return [stub, deadline_ms](const std::vector<LocalChange>& batch) -> std::unique_ptr<sync::upload::UploadResultStream> {
    return std::make_unique<GrpcUploadResultStream>(stub, batch, deadline_ms);
  };
}

} // namespace chartsync::remote
