#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace chartsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertResource(Transaction&, const model::ResourceRecord&) override;
  Result UpsertResource(Transaction&, const model::ResourceRecord&) override;
  Result UpdateResource(Transaction&, const model::ResourceRecord&) override;
  std::optional<model::ResourceRecord> GetResource(Transaction&, chartsync::v1::ResourceType,
                                                   const std::string&) override;
  std::optional<model::ResourceRecord> GetResourceByUuid(Transaction&, const std::string&) override;
  std::vector<model::ResourceRecord> ListResources(Transaction&, chartsync::v1::ResourceType) override;
  Result DeleteResource(Transaction&, chartsync::v1::ResourceType, const std::string&) override;

  Result ReplaceReferences(Transaction&, const std::string& source_uuid,
                           const std::vector<model::ReferenceRecord>&) override;
  std::vector<model::LinkedResourceRecord> GetReferencedResources(Transaction&, const std::vector<std::string>& source_uuids,
                                                                  const std::string& relation) override;
  std::vector<model::LinkedResourceRecord> GetReferencingResources(Transaction&, const std::vector<model::ResourceKey>& targets,
                                                                   const std::string&          relation,
                                                                   chartsync::v1::ResourceType source_type) override;

  Result AppendLocalChange(Transaction&, model::LocalChangeRecord&) override;
  std::vector<model::LocalChangeRecord> ListLocalChanges(Transaction&) override;
  std::vector<model::LocalChangeRecord> GetLocalChanges(Transaction&, chartsync::v1::ResourceType,
                                                        const std::string&) override;
  uint64_t CountLocalChanges(Transaction&) override;
  Result DeleteLocalChanges(Transaction&, const std::vector<int64_t>& ids, uint64_t& deleted) override;
  Result DeleteLocalChangesFor(Transaction&, chartsync::v1::ResourceType, const std::string&) override;

  Result PutSyncMetadata(Transaction&, const std::string& key, const std::string& value) override;
  std::optional<std::string> GetSyncMetadata(Transaction&, const std::string& key) override;

  Result Clear(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // keyed by "<type>/<logical_id>"; ordered so a type prefix scan yields logical_id order
    std::map<std::string, model::ResourceRecord> resources;
    std::unordered_map<std::string, std::string> uuid_to_key;

    std::unordered_map<std::string, std::vector<model::ReferenceRecord>> references;

    std::map<int64_t, model::LocalChangeRecord> local_changes;
    int64_t                                     next_local_change_id = 1;

    std::unordered_map<std::string, std::string> sync_metadata;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
