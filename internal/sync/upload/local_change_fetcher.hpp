#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <vector>

#include "config/config.pb.h"
#include "internal/store/record_store.hpp"

namespace chartsync::sync::upload {

enum class LocalChangesFetchMode {
  kAllChanges,  // one batch, squashed per resource
  kPerResource, // one squashed change per batch, earliest changed resource first
  kFixedSize,   // up to batch_size journal entries per batch, unsquashed
};

struct FetchProgress {
  uint64_t remaining     = 0;
  uint64_t initial_total = 0;
};

/*
  Hands out pending local changes in batches for upload.

  Usage contract:
    while (fetcher.HasNext()) { auto batch = fetcher.Next(); ... }

  Next() without a preceding HasNext() that returned true throws util::InvalidState.
  Journal entries already handed out are never handed out again, even if
  they are still in the journal because their upload failed.
*/
class LocalChangeFetcher {
 public:
  virtual ~LocalChangeFetcher() = default;

  virtual bool                                    HasNext()           = 0;
  virtual std::vector<chartsync::v1::LocalChange> Next()              = 0;
  virtual uint64_t                                Total() const       = 0;
  virtual FetchProgress                           GetProgress() const = 0;
};

// Collapses one resource's journal entries (in sequence order) into a single change.
chartsync::v1::LocalChange Squash(const std::vector<chartsync::v1::LocalChange>& entries);

// Squashes per resource; the result keeps the order in which resources were first changed.
std::vector<chartsync::v1::LocalChange> SquashByResource(const std::vector<chartsync::v1::LocalChange>& entries);

class JournalFetcher : public LocalChangeFetcher {
 public:
  explicit JournalFetcher(store::RecordStore& store);

  bool                                    HasNext() override;
  std::vector<chartsync::v1::LocalChange> Next() override;
  uint64_t                                Total() const override;
  FetchProgress                           GetProgress() const override;

 protected:
  // Picks the next batch out of the entries not handed out yet. Never empty input.
  virtual std::vector<chartsync::v1::LocalChange> Take(const std::vector<chartsync::v1::LocalChange>& pending) = 0;

 private:
  store::RecordStore& store_;

  uint64_t total_      = 0;
  uint64_t handed_out_ = 0;

  std::set<int64_t>                       seen_;
  std::vector<chartsync::v1::LocalChange> pending_;
  bool                                    ready_ = false;
};

class AllChangesFetcher final : public JournalFetcher {
 public:
  using JournalFetcher::JournalFetcher;

 protected:
  std::vector<chartsync::v1::LocalChange> Take(const std::vector<chartsync::v1::LocalChange>& pending) override;
};

class PerResourceFetcher final : public JournalFetcher {
 public:
  using JournalFetcher::JournalFetcher;

 protected:
  std::vector<chartsync::v1::LocalChange> Take(const std::vector<chartsync::v1::LocalChange>& pending) override;
};

class FixedSizeFetcher final : public JournalFetcher {
 public:
  FixedSizeFetcher(store::RecordStore& store, uint32_t batch_size);

 protected:
  std::vector<chartsync::v1::LocalChange> Take(const std::vector<chartsync::v1::LocalChange>& pending) override;

 private:
  uint32_t batch_size_;
};

class LocalChangeFetcherFactory {
 public:
  static std::unique_ptr<LocalChangeFetcher> ByMode(LocalChangesFetchMode mode, store::RecordStore& store,
                                                    uint32_t batch_size);
};

LocalChangesFetchMode FetchModeFromConfig(chartsync::runtime::config::UploadFetchMode mode);

} // namespace chartsync::sync::upload
