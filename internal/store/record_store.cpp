#include "record_store.hpp"

#include <stdexcept>

#include "internal/model/resource_type.hpp"
#include "internal/store/resource_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace chartsync::store {

using namespace chartsync::v1;

namespace {

constexpr const char* kLastSyncTimestampKey = "last_sync_timestamp_ms";

void ThrowIfDbError(const chartsync::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + std::string(chartsync::db::ToString(result.code)) + "]";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case chartsync::db::ErrorCode::AlreadyExists:
      throw chartsync::util::AlreadyExists(message);
    case chartsync::db::ErrorCode::NotFound:
      throw chartsync::util::NotFound(message);
    case chartsync::db::ErrorCode::Conflict:
      throw chartsync::util::InvalidState(message);
    default:
      throw chartsync::util::TransactionFailure(message);
  }
}

std::string Describe(ResourceType type, const std::string& logical_id) {
  return chartsync::model::TypeWithId(type, logical_id);
}

} // namespace

RecordStore::RecordStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("record store requires a repository");
  }
}

std::unique_ptr<db::Transaction> RecordStore::Begin() {
  return repository_->Begin();
}

void RecordStore::CommitOrThrow(db::Transaction& tx) {
  try {
    tx.Commit();
  } catch (const chartsync::util::TransactionFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw chartsync::util::TransactionFailure(std::string("commit failed: ") + e.what());
  }
}

void RecordStore::AppendJournal(db::Transaction& tx, ChangeType change_type, ResourceType type, const std::string& logical_id,
                                const std::string& version_id, const std::string& payload_json) {
  db::model::LocalChangeRecord change;
  change.type         = type;
  change.resource_id  = logical_id;
  change.change_type  = change_type;
  change.version_id   = version_id;
  change.payload_json = payload_json;
  change.timestamp_ms = chartsync::util::ToUnixMillis(chartsync::util::Now());
  ThrowIfDbError(repository_->AppendLocalChange(tx, change), "append local change for " + Describe(type, logical_id));
}

// ---------------------------------------------------------------------
// Local mutations
// ---------------------------------------------------------------------

std::vector<std::string> RecordStore::Insert(db::Transaction& tx, const std::vector<Resource>& resources) {
  std::vector<std::string> ids;
  ids.reserve(resources.size());

  for (const auto& input : resources) {
    Resource resource = input;
    if (resource.logical_id().empty()) {
      resource.set_logical_id(chartsync::util::GenerateUUIDString());
    }
    *resource.mutable_last_updated() = chartsync::util::ToProto(chartsync::util::Now());

    const auto uuid   = chartsync::util::GenerateUUIDString();
    const auto record = ToRecord(resource, uuid);
    ThrowIfDbError(repository_->InsertResource(tx, record), "insert " + Describe(resource.type(), resource.logical_id()));
    ThrowIfDbError(repository_->ReplaceReferences(tx, uuid, ToReferenceRecords(resource, uuid)), "index references");

    AppendJournal(tx, CHANGE_TYPE_INSERT, resource.type(), resource.logical_id(), resource.version_id(), record.json);
    ids.push_back(resource.logical_id());
  }
  return ids;
}

void RecordStore::Update(db::Transaction& tx, const std::vector<Resource>& resources) {
  for (const auto& input : resources) {
    auto existing = repository_->GetResource(tx, input.type(), input.logical_id());
    if (!existing) {
      throw chartsync::util::NotFound("resource not found: " + Describe(input.type(), input.logical_id()));
    }

    // local edits never move the server version
    Resource resource = input;
    resource.set_version_id(existing->version_id);
    *resource.mutable_last_updated() = chartsync::util::ToProto(chartsync::util::Now());

    const auto record = ToRecord(resource, existing->uuid);
    ThrowIfDbError(repository_->UpdateResource(tx, record), "update " + Describe(resource.type(), resource.logical_id()));
    ThrowIfDbError(repository_->ReplaceReferences(tx, existing->uuid, ToReferenceRecords(resource, existing->uuid)),
                   "index references");

    AppendJournal(tx, CHANGE_TYPE_UPDATE, resource.type(), resource.logical_id(), existing->version_id, record.json);
  }
}

void RecordStore::Delete(db::Transaction& tx, ResourceType type, const std::string& logical_id) {
  auto existing = repository_->GetResource(tx, type, logical_id);
  if (!existing) {
    return;
  }
  ThrowIfDbError(repository_->DeleteResource(tx, type, logical_id), "delete " + Describe(type, logical_id));
  AppendJournal(tx, CHANGE_TYPE_DELETE, type, logical_id, existing->version_id, "");
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

Resource RecordStore::Select(db::Transaction& tx, ResourceType type, const std::string& logical_id) {
  auto resource = Find(tx, type, logical_id);
  if (!resource) {
    throw chartsync::util::NotFound("resource not found: " + Describe(type, logical_id));
  }
  return *std::move(resource);
}

std::optional<Resource> RecordStore::Find(db::Transaction& tx, ResourceType type, const std::string& logical_id) {
  auto record = repository_->GetResource(tx, type, logical_id);
  if (!record) {
    return std::nullopt;
  }
  return FromRecord(*record);
}

// ---------------------------------------------------------------------
// Synced writes
// ---------------------------------------------------------------------

void RecordStore::WriteSynced(db::Transaction& tx, const Resource& resource) {
  if (resource.logical_id().empty()) {
    throw chartsync::util::InvalidState("synced resource without logical id");
  }

  Resource stored = resource;
  if (!stored.has_last_updated()) {
    *stored.mutable_last_updated() = chartsync::util::ToProto(chartsync::util::Now());
  }

  const auto existing = repository_->GetResource(tx, stored.type(), stored.logical_id());
  const auto uuid     = existing ? existing->uuid : chartsync::util::GenerateUUIDString();

  ThrowIfDbError(repository_->UpsertResource(tx, ToRecord(stored, uuid)), "write synced " + Describe(stored.type(), stored.logical_id()));
  ThrowIfDbError(repository_->ReplaceReferences(tx, uuid, ToReferenceRecords(stored, uuid)), "index references");
}

void RecordStore::InsertSyncedResources(db::Transaction& tx, const std::vector<Resource>& resources) {
  for (const auto& resource : resources) {
    WriteSynced(tx, resource);
  }
}

void RecordStore::Restore(db::Transaction& tx, ResourceType type, const std::string& logical_id,
                          const std::optional<Resource>& snapshot) {
  if (snapshot) {
    WriteSynced(tx, *snapshot);
    return;
  }
  auto result = repository_->DeleteResource(tx, type, logical_id);
  if (result.code == chartsync::db::ErrorCode::NotFound) {
    return;
  }
  ThrowIfDbError(result, "restore " + Describe(type, logical_id));
}

bool RecordStore::UpdateVersionIdAndLastUpdated(db::Transaction& tx, ResourceType type, const std::string& logical_id,
                                                const std::string& version_id, const google::protobuf::Timestamp& last_updated) {
  auto existing = repository_->GetResource(tx, type, logical_id);
  if (!existing) {
    return false;
  }

  auto resource = FromRecord(*existing);
  resource.set_version_id(version_id);
  *resource.mutable_last_updated() = last_updated;

  ThrowIfDbError(repository_->UpdateResource(tx, ToRecord(resource, existing->uuid)), "update version of " + Describe(type, logical_id));
  return true;
}

// ---------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------

std::vector<LocalChange> RecordStore::GetLocalChanges(db::Transaction& tx, ResourceType type, const std::string& logical_id) {
  std::vector<LocalChange> out;
  for (const auto& record : repository_->GetLocalChanges(tx, type, logical_id)) {
    out.push_back(FromRecord(record));
  }
  return out;
}

std::vector<LocalChange> RecordStore::GetAllLocalChanges(db::Transaction& tx) {
  std::vector<LocalChange> out;
  for (const auto& record : repository_->ListLocalChanges(tx)) {
    out.push_back(FromRecord(record));
  }
  return out;
}

uint64_t RecordStore::GetLocalChangesCount(db::Transaction& tx) {
  return repository_->CountLocalChanges(tx);
}

void RecordStore::DeleteUpdates(db::Transaction& tx, const std::vector<Resource>& resources) {
  for (const auto& resource : resources) {
    ThrowIfDbError(repository_->DeleteLocalChangesFor(tx, resource.type(), resource.logical_id()),
                   "drop local changes of " + Describe(resource.type(), resource.logical_id()));
  }
}

uint64_t RecordStore::DeleteUpdates(db::Transaction& tx, const google::protobuf::RepeatedField<int64_t>& token) {
  uint64_t deleted = 0;
  ThrowIfDbError(repository_->DeleteLocalChanges(tx, std::vector<int64_t>(token.begin(), token.end()), deleted),
                 "drop local changes");
  return deleted;
}

// ---------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------

void RecordStore::Purge(db::Transaction& tx, ResourceType type, const std::vector<std::string>& logical_ids, bool force) {
  for (const auto& logical_id : logical_ids) {
    if (!repository_->GetResource(tx, type, logical_id)) {
      throw chartsync::util::NotFound("resource not found: " + Describe(type, logical_id));
    }

    const auto pending = repository_->GetLocalChanges(tx, type, logical_id);
    if (!pending.empty() && !force) {
      throw chartsync::util::InvalidState("resource " + Describe(type, logical_id) +
                                          " has local changes; discard them or purge with force");
    }

    ThrowIfDbError(repository_->DeleteResource(tx, type, logical_id), "purge " + Describe(type, logical_id));
    if (!pending.empty()) {
      ThrowIfDbError(repository_->DeleteLocalChangesFor(tx, type, logical_id), "purge local changes of " + Describe(type, logical_id));
    }
  }
}

void RecordStore::Clear(db::Transaction& tx) {
  ThrowIfDbError(repository_->Clear(tx), "clear");
}

std::optional<chartsync::util::TimePoint> RecordStore::ReadLastSyncTimestamp(db::Transaction& tx) {
  auto value = repository_->GetSyncMetadata(tx, kLastSyncTimestampKey);
  if (!value) {
    return std::nullopt;
  }
  return chartsync::util::FromUnixMillis(std::stoull(*value));
}

void RecordStore::WriteLastSyncTimestamp(db::Transaction& tx, chartsync::util::TimePoint timestamp) {
  ThrowIfDbError(repository_->PutSyncMetadata(tx, kLastSyncTimestampKey, std::to_string(chartsync::util::ToUnixMillis(timestamp))),
                 "write last sync timestamp");
}

} // namespace chartsync::store
