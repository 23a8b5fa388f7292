#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace chartsync::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
