#include "record_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/search/search_composer.hpp"
#include "internal/store/store_query_executor.hpp"

namespace chartsync::engine {

using namespace chartsync::v1;

RecordEngine::RecordEngine(std::shared_ptr<store::RecordStore> store, EngineOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("record engine requires a store");
  }
}

std::vector<std::string> RecordEngine::Create(const std::vector<Resource>& resources) {
  return store_->WithTransaction([&](db::Transaction& tx) { return store_->Insert(tx, resources); });
}

Resource RecordEngine::Get(ResourceType type, const std::string& logical_id) {
  return store_->WithTransaction([&](db::Transaction& tx) { return store_->Select(tx, type, logical_id); });
}

void RecordEngine::Update(const std::vector<Resource>& resources) {
  store_->WithTransaction([&](db::Transaction& tx) { store_->Update(tx, resources); });
}

void RecordEngine::Delete(ResourceType type, const std::string& logical_id) {
  store_->WithTransaction([&](db::Transaction& tx) { store_->Delete(tx, type, logical_id); });
}

std::vector<search::SearchResult> RecordEngine::Search(const search::Search& query) {
  return store_->WithTransaction([&](db::Transaction& tx) {
    store::StoreQueryExecutor executor(store_->GetRepository(), tx);
    search::SearchComposer    composer(executor);
    return composer.Compose(query);
  });
}

uint64_t RecordEngine::Count(const search::Search& query) {
  return store_->WithTransaction([&](db::Transaction& tx) {
    store::StoreQueryExecutor executor(store_->GetRepository(), tx);
    return executor.ExecuteCount(query);
  });
}

std::vector<LocalChange> RecordEngine::GetLocalChanges(ResourceType type, const std::string& logical_id) {
  return store_->WithTransaction([&](db::Transaction& tx) { return store_->GetLocalChanges(tx, type, logical_id); });
}

std::vector<LocalChange> RecordEngine::GetUnsyncedLocalChanges() {
  return store_->WithTransaction([&](db::Transaction& tx) { return store_->GetAllLocalChanges(tx); });
}

void RecordEngine::Purge(ResourceType type, const std::vector<std::string>& logical_ids, bool force) {
  store_->WithTransaction([&](db::Transaction& tx) { store_->Purge(tx, type, logical_ids, force); });
}

void RecordEngine::ClearDatabase() {
  store_->WithTransaction([&](db::Transaction& tx) { store_->Clear(tx); });
  CHARTSYNC_LOG_INFO("database cleared");
}

std::optional<chartsync::util::TimePoint> RecordEngine::GetLastSyncTimestamp() {
  return store_->WithTransaction([&](db::Transaction& tx) { return store_->ReadLastSyncTimestamp(tx); });
}

void RecordEngine::SetLastSyncTimestamp(chartsync::util::TimePoint timestamp) {
  store_->WithTransaction([&](db::Transaction& tx) { store_->WriteLastSyncTimestamp(tx, timestamp); });
}

sync::DownloadSummary RecordEngine::SyncDownload(const sync::ConflictResolver& resolver, sync::DownloadSource& source) {
  sync::DownloadMerger merger(*store_, resolver);
  return merger.Run(source);
}

std::unique_ptr<sync::upload::SyncUploadFlow> RecordEngine::SyncUpload(sync::upload::LocalChangesFetchMode mode,
                                                                       sync::upload::UploadFn            upload_fn) {
  auto* store      = store_.get();
  auto  batch_size = options_.upload_batch_size;

  return std::make_unique<sync::upload::SyncUploadFlow>(
      [store, mode, batch_size] { return sync::upload::LocalChangeFetcherFactory::ByMode(mode, *store, batch_size); },
      std::move(upload_fn), std::make_unique<sync::upload::DefaultResourceConsolidator>(*store_));
}

} // namespace chartsync::engine
