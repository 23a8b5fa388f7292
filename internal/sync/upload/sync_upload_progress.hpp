#pragma once

#include <cstdint>
#include <optional>

#include "internal/sync/upload/upload_request_result.hpp"

namespace chartsync::sync::upload {

/*
  Snapshot emitted by the upload flow.

  initial_total is fixed for one run; remaining never increases.
*/
struct SyncUploadProgress {
  uint64_t remaining     = 0;
  uint64_t initial_total = 0;

  std::optional<UploadError> upload_error;
};

} // namespace chartsync::sync::upload
