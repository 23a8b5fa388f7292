#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/sync/upload/upload_request_result.hpp"

namespace chartsync::sync::upload {

/*
  Lazy stream of per-change upload outcomes.

  The transport decides how many results it yields for a batch; the
  flow stops pulling after the first failure.
*/
class UploadResultStream {
 public:
  virtual ~UploadResultStream() = default;

  virtual std::optional<UploadRequestResult> Next() = 0;
};

using UploadFn = std::function<std::unique_ptr<UploadResultStream>(const std::vector<chartsync::v1::LocalChange>&)>;

// Yields precomputed results in order.
class VectorUploadResultStream final : public UploadResultStream {
 public:
  explicit VectorUploadResultStream(std::vector<UploadRequestResult> results) : results_(std::move(results)) {
  }

  std::optional<UploadRequestResult> Next() override {
    if (next_ >= results_.size()) {
      return std::nullopt;
    }
    return results_[next_++];
  }

 private:
  std::vector<UploadRequestResult> results_;
  std::size_t                      next_ = 0;
};

} // namespace chartsync::sync::upload
