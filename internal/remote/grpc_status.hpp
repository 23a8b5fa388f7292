#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/sync/upload/upload_request_result.hpp"

namespace chartsync::remote {

/*
  Converts gRPC statuses from the remote store into upload errors.
*/

sync::upload::UploadError ToUploadError(const ::grpc::Status& status);

// Converts internal exceptions into gRPC status codes for service implementations.
::grpc::Status ToStatus(const std::exception& e);

} // namespace chartsync::remote
