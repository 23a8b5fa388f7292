#pragma once

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <memory>
#include <optional>

#include "chartsync/v1.hpp"
#include "internal/sync/download/download_source.hpp"
#include "internal/sync/upload/upload_transport.hpp"
#include "internal/util/time.hpp"

namespace chartsync::remote {

struct RemoteOptions {
  // Per-call deadline; 0 disables it.
  uint32_t deadline_ms = 30'000;

  // Requested batch size for Download; 0 lets the server choose.
  uint32_t download_batch_size = 0;
};

/*
  Adapts RemoteStoreService to the sync pipelines.

  OpenDownload() wraps the server-streaming Download call as a DownloadSource.
  MakeUploadFn() issues one unary Upload per change, lazily, as results are pulled.
  A non-OK status becomes an UploadFailure; the caller decides whether to continue.
*/
class GrpcRemoteTransport {
 public:
  GrpcRemoteTransport(std::shared_ptr<::grpc::Channel> channel, RemoteOptions options);

  std::unique_ptr<sync::DownloadSource> OpenDownload(std::optional<chartsync::util::TimePoint> since);

  sync::upload::UploadFn MakeUploadFn();

 private:
  std::shared_ptr<chartsync::v1::RemoteStoreService::Stub> stub_;
  RemoteOptions                                            options_;
};

} // namespace chartsync::remote
