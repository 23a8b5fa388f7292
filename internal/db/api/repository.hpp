#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/local_change_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/model/resource_record.hpp"

namespace chartsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Journal sequence numbers are assigned monotonically and never reused
  - (type, logical_id) is unique across resources

  The DB is the source of truth for:
    current resource values
    the local change journal
    sync bookkeeping (last sync timestamp)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Resources
  // ---------------------------------------------------------------------

  // AlreadyExists when (type, logical_id) is taken.
  virtual Result InsertResource(Transaction&, const model::ResourceRecord&) = 0;

  // Insert or overwrite by (type, logical_id). An existing row keeps its uuid.
  virtual Result UpsertResource(Transaction&, const model::ResourceRecord&) = 0;

  // NotFound when (type, logical_id) is absent. The stored uuid is kept.
  virtual Result UpdateResource(Transaction&, const model::ResourceRecord&) = 0;

  virtual std::optional<model::ResourceRecord> GetResource(Transaction&, chartsync::v1::ResourceType type,
                                                           const std::string& logical_id) = 0;

  virtual std::optional<model::ResourceRecord> GetResourceByUuid(Transaction&, const std::string& uuid) = 0;

  // Ordered by logical_id.
  virtual std::vector<model::ResourceRecord> ListResources(Transaction&, chartsync::v1::ResourceType type) = 0;

  // NotFound when absent. Outgoing references are dropped with the row.
  virtual Result DeleteResource(Transaction&, chartsync::v1::ResourceType type, const std::string& logical_id) = 0;

  // ---------------------------------------------------------------------
  // Reference index
  // ---------------------------------------------------------------------

  virtual Result ReplaceReferences(Transaction&, const std::string& source_uuid,
                                   const std::vector<model::ReferenceRecord>& references) = 0;

  // Bulk include lookups. One call serves a whole page of base resources;
  // references whose far end is not stored are skipped.

  // Resources referenced under `relation` by any of `source_uuids`.
  // Rows of one source keep the order its references were written in.
  virtual std::vector<model::LinkedResourceRecord> GetReferencedResources(Transaction&,
                                                                          const std::vector<std::string>& source_uuids,
                                                                          const std::string&              relation) = 0;

  // Resources of `source_type` that reference any of `targets` under `relation`.
  // Rows of one target are ordered by source logical_id.
  virtual std::vector<model::LinkedResourceRecord> GetReferencingResources(Transaction&,
                                                                           const std::vector<model::ResourceKey>& targets,
                                                                           const std::string&                     relation,
                                                                           chartsync::v1::ResourceType            source_type) = 0;

  // ---------------------------------------------------------------------
  // Local change journal
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result AppendLocalChange(Transaction&, model::LocalChangeRecord& record) = 0;

  // Ordered by id.
  virtual std::vector<model::LocalChangeRecord> ListLocalChanges(Transaction&) = 0;

  virtual std::vector<model::LocalChangeRecord> GetLocalChanges(Transaction&, chartsync::v1::ResourceType type,
                                                                const std::string& resource_id) = 0;

  virtual uint64_t CountLocalChanges(Transaction&) = 0;

  // Ids that are not in the journal are skipped; `deleted` reports how many rows went away.
  virtual Result DeleteLocalChanges(Transaction&, const std::vector<int64_t>& ids, uint64_t& deleted) = 0;

  virtual Result DeleteLocalChangesFor(Transaction&, chartsync::v1::ResourceType type, const std::string& resource_id) = 0;

  // ---------------------------------------------------------------------
  // Sync bookkeeping
  // ---------------------------------------------------------------------

  virtual Result PutSyncMetadata(Transaction&, const std::string& key, const std::string& value) = 0;

  virtual std::optional<std::string> GetSyncMetadata(Transaction&, const std::string& key) = 0;

  // Drops every resource, reference, journal entry and metadata key.
  virtual Result Clear(Transaction&) = 0;
};

} // namespace chartsync::db
