#include "grpc_status.hpp"

#include "internal/util/errors.hpp"

namespace chartsync::remote {

using sync::upload::UploadError;
using sync::upload::UploadErrorCode;

UploadError ToUploadError(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::CANCELLED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return {UploadErrorCode::kTransport, status.error_message()};
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::NOT_FOUND:
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return {UploadErrorCode::kRejected, status.error_message()};
    case ::grpc::StatusCode::ABORTED:
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return {UploadErrorCode::kConflict, status.error_message()};
    default:
      return {UploadErrorCode::kUnknown, status.error_message()};
  }
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace chartsync::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const TransactionFailure*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace chartsync::remote
