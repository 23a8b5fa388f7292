#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "chartsync/v1.hpp"

namespace chartsync::sync::upload {

enum class UploadErrorCode {
  kTransport, // remote unreachable or timed out
  kRejected,  // remote refused the change as invalid
  kConflict,  // remote holds a newer version
  kStorage,   // local journal or record store could not be read or written
  kUnknown,
};

struct UploadError {
  UploadErrorCode code = UploadErrorCode::kUnknown;
  std::string     message;
};

struct UploadSuccess {
  chartsync::v1::LocalChange local_change;

  // Remote representation after the change, when the transport returned one.
  std::optional<chartsync::v1::Resource> remote;
};

struct UploadFailure {
  chartsync::v1::LocalChange local_change;
  UploadError                error;
};

using UploadRequestResult = std::variant<UploadSuccess, UploadFailure>;

std::string_view ToString(UploadErrorCode code);

} // namespace chartsync::sync::upload
