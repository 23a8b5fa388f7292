#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/search/search.hpp"
#include "internal/search/search_result.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/conflict_resolver.hpp"
#include "internal/sync/download/download_merger.hpp"
#include "internal/sync/download/download_source.hpp"
#include "internal/sync/upload/local_change_fetcher.hpp"
#include "internal/sync/upload/sync_upload_flow.hpp"
#include "internal/sync/upload/upload_transport.hpp"
#include "internal/util/time.hpp"

namespace chartsync::engine {

struct EngineOptions {
  // Batch size for LocalChangesFetchMode::kFixedSize.
  uint32_t upload_batch_size = 50;
};

/*
  Public entry point of the record store.

  Every call is self-contained: it opens, commits or rolls back its own
  transaction. Download and upload runs must not overlap on one engine.
*/
class RecordEngine {
 public:
  RecordEngine(std::shared_ptr<store::RecordStore> store, EngineOptions options = {});

  // Returns the logical ids, generated where the input had none.
  std::vector<std::string> Create(const std::vector<chartsync::v1::Resource>& resources);
  chartsync::v1::Resource  Get(chartsync::v1::ResourceType type, const std::string& logical_id);
  void                     Update(const std::vector<chartsync::v1::Resource>& resources);
  void                     Delete(chartsync::v1::ResourceType type, const std::string& logical_id);

  std::vector<search::SearchResult> Search(const search::Search& query);
  uint64_t                          Count(const search::Search& query);

  std::vector<chartsync::v1::LocalChange> GetLocalChanges(chartsync::v1::ResourceType type, const std::string& logical_id);
  std::vector<chartsync::v1::LocalChange> GetUnsyncedLocalChanges();

  void Purge(chartsync::v1::ResourceType type, const std::vector<std::string>& logical_ids, bool force = false);
  void ClearDatabase();

  std::optional<chartsync::util::TimePoint> GetLastSyncTimestamp();
  void                                      SetLastSyncTimestamp(chartsync::util::TimePoint timestamp);

  sync::DownloadSummary SyncDownload(const sync::ConflictResolver& resolver, sync::DownloadSource& source);

  // The returned flow borrows the engine's store and must not outlive the engine.
  std::unique_ptr<sync::upload::SyncUploadFlow> SyncUpload(sync::upload::LocalChangesFetchMode mode,
                                                           sync::upload::UploadFn            upload_fn);

  store::RecordStore& Store() {
    return *store_;
  }

 private:
  std::shared_ptr<store::RecordStore> store_;
  EngineOptions                       options_;
};

} // namespace chartsync::engine
