#pragma once

#include <cstddef>
#include <vector>

#include "internal/sync/download/download_source.hpp"

namespace chartsync::sync {

// Serves batches prepared up front. Used for file imports.
class VectorDownloadSource final : public DownloadSource {
 public:
  explicit VectorDownloadSource(std::vector<std::vector<chartsync::v1::Resource>> batches);

  std::optional<std::vector<chartsync::v1::Resource>> Next() override;
  void                                                Cancel() override;

  bool Cancelled() const {
    return cancelled_;
  }

 private:
  std::vector<std::vector<chartsync::v1::Resource>> batches_;
  std::size_t                                       next_      = 0;
  bool                                              cancelled_ = false;
};

} // namespace chartsync::sync
