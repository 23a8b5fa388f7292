#include "channel_download_source.hpp"

#include <stdexcept>

namespace chartsync::sync {

ChannelDownloadSource::ChannelDownloadSource(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("channel capacity must be positive");
  }
}

bool ChannelDownloadSource::Push(std::vector<chartsync::v1::Resource> batch) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return closed_ || cancelled_ || queue_.size() < capacity_; });

    if (closed_ || cancelled_) return false;

    queue_.push_back(std::move(batch));
  }
  not_empty_.notify_one();
  return true;
}

void ChannelDownloadSource::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::optional<std::vector<chartsync::v1::Resource>> ChannelDownloadSource::Next() {
  std::vector<chartsync::v1::Resource> batch;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return closed_ || cancelled_ || !queue_.empty(); });

    if (cancelled_ || queue_.empty()) return std::nullopt;

    batch = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return batch;
}

void ChannelDownloadSource::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
    queue_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool ChannelDownloadSource::Cancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

} // namespace chartsync::sync
