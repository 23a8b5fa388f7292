#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "chartsync/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace chartsync::store {

/*
  Record store: resources plus the local change journal.

  Local mutations (Insert/Update/Delete) write the resource and append a
  journal entry in the same transaction. Synced writes (remote baseline,
  resolved conflicts, restores) touch only the resource row.

  Every operation runs inside a caller supplied transaction so that
  pipelines can group several of them into one atomic unit.
*/
class RecordStore {
 public:
  explicit RecordStore(std::shared_ptr<db::Repository> repository);

  std::unique_ptr<db::Transaction> Begin();

  // Runs `block` in a fresh transaction. Commits when it returns, rolls back when it throws.
  // A failed commit is reported as util::TransactionFailure.
  template <typename Fn>
  auto WithTransaction(Fn&& block) {
    auto tx = Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, db::Transaction&>>) {
      block(*tx);
      CommitOrThrow(*tx);
    } else {
      auto result = block(*tx);
      CommitOrThrow(*tx);
      return result;
    }
  }

  db::Repository& GetRepository() {
    return *repository_;
  }

  // ---------------------------------------------------------------------
  // Local mutations (journaled)
  // ---------------------------------------------------------------------

  // Empty logical ids receive a generated one. Throws AlreadyExists.
  std::vector<std::string> Insert(db::Transaction& tx, const std::vector<chartsync::v1::Resource>& resources);

  // Throws NotFound for an unknown identity.
  void Update(db::Transaction& tx, const std::vector<chartsync::v1::Resource>& resources);

  // No-op for an unknown identity.
  void Delete(db::Transaction& tx, chartsync::v1::ResourceType type, const std::string& logical_id);

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  // Throws NotFound.
  chartsync::v1::Resource Select(db::Transaction& tx, chartsync::v1::ResourceType type, const std::string& logical_id);

  std::optional<chartsync::v1::Resource> Find(db::Transaction& tx, chartsync::v1::ResourceType type, const std::string& logical_id);

  // ---------------------------------------------------------------------
  // Synced writes (not journaled)
  // ---------------------------------------------------------------------

  // Inserts or overwrites each resource as the latest synced value.
  void InsertSyncedResources(db::Transaction& tx, const std::vector<chartsync::v1::Resource>& resources);

  // Puts back a value captured earlier in the transaction; nullopt removes the row again.
  void Restore(db::Transaction& tx, chartsync::v1::ResourceType type, const std::string& logical_id,
               const std::optional<chartsync::v1::Resource>& snapshot);

  // Returns false when the resource is no longer stored locally.
  bool UpdateVersionIdAndLastUpdated(db::Transaction& tx, chartsync::v1::ResourceType type, const std::string& logical_id,
                                     const std::string& version_id, const google::protobuf::Timestamp& last_updated);

  // ---------------------------------------------------------------------
  // Journal
  // ---------------------------------------------------------------------

  std::vector<chartsync::v1::LocalChange> GetLocalChanges(db::Transaction& tx, chartsync::v1::ResourceType type,
                                                          const std::string& logical_id);

  // Ordered by journal sequence number, one LocalChange per entry.
  std::vector<chartsync::v1::LocalChange> GetAllLocalChanges(db::Transaction& tx);

  uint64_t GetLocalChangesCount(db::Transaction& tx);

  // Drops every journal entry of each resource's identity.
  void DeleteUpdates(db::Transaction& tx, const std::vector<chartsync::v1::Resource>& resources);

  // Drops the journal entries named by the token; returns how many were still present.
  uint64_t DeleteUpdates(db::Transaction& tx, const google::protobuf::RepeatedField<int64_t>& token);

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Throws NotFound for an unknown id, InvalidState for pending changes without `force`.
  void Purge(db::Transaction& tx, chartsync::v1::ResourceType type, const std::vector<std::string>& logical_ids, bool force);

  void Clear(db::Transaction& tx);

  std::optional<chartsync::util::TimePoint> ReadLastSyncTimestamp(db::Transaction& tx);
  void                                      WriteLastSyncTimestamp(db::Transaction& tx, chartsync::util::TimePoint timestamp);

 private:
  static void CommitOrThrow(db::Transaction& tx);

  void AppendJournal(db::Transaction& tx, chartsync::v1::ChangeType change_type, chartsync::v1::ResourceType type,
                     const std::string& logical_id, const std::string& version_id, const std::string& payload_json);

  void WriteSynced(db::Transaction& tx, const chartsync::v1::Resource& resource);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace chartsync::store
