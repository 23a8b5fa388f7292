#include "vector_download_source.hpp"

namespace chartsync::sync {

VectorDownloadSource::VectorDownloadSource(std::vector<std::vector<chartsync::v1::Resource>> batches)
    : batches_(std::move(batches)) {
}

std::optional<std::vector<chartsync::v1::Resource>> VectorDownloadSource::Next() {
  if (cancelled_ || next_ >= batches_.size()) {
    return std::nullopt;
  }
  return batches_[next_++];
}

void VectorDownloadSource::Cancel() {
  cancelled_ = true;
}

} // namespace chartsync::sync
