#include "upload_request_result.hpp"

namespace chartsync::sync::upload {

std::string_view ToString(UploadErrorCode code) {
  switch (code) {
    case UploadErrorCode::kTransport:
      return "transport";
    case UploadErrorCode::kRejected:
      return "rejected";
    case UploadErrorCode::kConflict:
      return "conflict";
    case UploadErrorCode::kStorage:
      return "storage";
    case UploadErrorCode::kUnknown:
    default:
      return "unknown";
  }
}

} // namespace chartsync::sync::upload
