#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "internal/sync/download/download_source.hpp"

namespace chartsync::sync {

/*
  Thread-safe bounded queue between a producer thread and the download pipeline.

  Push() blocks while `capacity` batches are queued.
  Close() marks the end of input; queued batches are still delivered.
  Cancel() drops queued batches and wakes both sides.
*/
class ChannelDownloadSource final : public DownloadSource {
 public:
  explicit ChannelDownloadSource(std::size_t capacity);

  // Returns false when the channel was closed or cancelled.
  bool Push(std::vector<chartsync::v1::Resource> batch);

  void Close();

  std::optional<std::vector<chartsync::v1::Resource>> Next() override;
  void                                                Cancel() override;

  bool Cancelled() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex                               mutex_;
  std::condition_variable                          not_empty_;
  std::condition_variable                          not_full_;
  std::deque<std::vector<chartsync::v1::Resource>> queue_;
  bool                                             closed_    = false;
  bool                                             cancelled_ = false;
};

} // namespace chartsync::sync
