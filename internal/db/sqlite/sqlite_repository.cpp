#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

namespace chartsync::db::sqlite {

using chartsync::db::ErrorCode;
using chartsync::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Statement(nullptr, &sqlite3_finalize);
  }
  return Statement(st, &sqlite3_finalize);
}

// Reads have no Result channel; a statement that does not prepare is a schema bug.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kResourceColumns = "uuid,type,logical_id,version_id,last_updated_ms,json";

// Reads kResourceColumns starting at column `first`.
model::ResourceRecord ReadResource(sqlite3_stmt* st, int first = 0) {
  model::ResourceRecord r;
  r.uuid            = ColText(st, first);
  r.type            = static_cast<chartsync::v1::ResourceType>(ColI32(st, first + 1));
  r.logical_id      = ColText(st, first + 2);
  r.version_id      = ColText(st, first + 3);
  r.last_updated_ms = ColU64(st, first + 4);
  r.json            = ColText(st, first + 5);
  return r;
}

model::LocalChangeRecord ReadLocalChange(sqlite3_stmt* st) {
  model::LocalChangeRecord r;
  r.id           = ColI64(st, 0);
  r.type         = static_cast<chartsync::v1::ResourceType>(ColI32(st, 1));
  r.resource_id  = ColText(st, 2);
  r.change_type  = static_cast<chartsync::v1::ChangeType>(ColI32(st, 3));
  r.version_id   = ColText(st, 4);
  r.payload_json = ColText(st, 5);
  r.timestamp_ms = ColU64(st, 6);
  return r;
}

// Keys per bulk statement; keeps the bound parameter count well under SQLITE_MAX_VARIABLE_NUMBER.
constexpr std::size_t kBulkChunk = 400;

std::string Placeholders(std::size_t n, const char* one) {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out += ',';
    out += one;
  }
  return out;
}

model::ReferenceRecord ReadReference(sqlite3_stmt* st) {
  model::ReferenceRecord r;
  r.source_uuid = ColText(st, 0);
  r.relation    = ColText(st, 1);
  r.target_type = static_cast<chartsync::v1::ResourceType>(ColI32(st, 2));
  r.target_id   = ColText(st, 3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result SqliteRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
    auto* db = TX(t).Handle();

    if (GetResource(t, r.type, r.logical_id))
        return Result::Err(ErrorCode::AlreadyExists, r.logical_id);

    auto st = Prepare(db,
        "INSERT INTO resource(uuid,type,logical_id,version_id,last_updated_ms,json) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.uuid);
    BindI32(st.get(), 2, static_cast<int>(r.type));
    BindText(st.get(), 3, r.logical_id);
    BindText(st.get(), 4, r.version_id);
    BindU64(st.get(), 5, r.last_updated_ms);
    BindText(st.get(), 6, r.json);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpsertResource(Transaction& t, const model::ResourceRecord& r) {
    // Update in place first so an existing row keeps its uuid and reference rows stay attached.
    auto update = UpdateResource(t, r);
    if (update.code != ErrorCode::NotFound) return update;

    return InsertResource(t, r);
}

Result SqliteRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE resource SET version_id=?,last_updated_ms=?,json=? WHERE type=? AND logical_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.version_id);
    BindU64(st.get(), 2, r.last_updated_ms);
    BindText(st.get(), 3, r.json);
    BindI32(st.get(), 4, static_cast<int>(r.type));
    BindText(st.get(), 5, r.logical_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.logical_id);
    return result;
}

std::optional<model::ResourceRecord>
SqliteRepository::GetResource(Transaction& t, chartsync::v1::ResourceType type, const std::string& logical_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kResourceColumns + " FROM resource WHERE type=? AND logical_id=?;";
    auto st = PrepareOrThrow(db, sql.c_str());

    BindI32(st.get(), 1, static_cast<int>(type));
    BindText(st.get(), 2, logical_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadResource(st.get());
}

std::optional<model::ResourceRecord>
SqliteRepository::GetResourceByUuid(Transaction& t, const std::string& uuid) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kResourceColumns + " FROM resource WHERE uuid=?;";
    auto st = PrepareOrThrow(db, sql.c_str());

    BindText(st.get(), 1, uuid);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadResource(st.get());
}

std::vector<model::ResourceRecord>
SqliteRepository::ListResources(Transaction& t, chartsync::v1::ResourceType type) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kResourceColumns + " FROM resource WHERE type=? ORDER BY logical_id;";
    auto st = PrepareOrThrow(db, sql.c_str());

    BindI32(st.get(), 1, static_cast<int>(type));

    std::vector<model::ResourceRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadResource(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteResource(Transaction& t, chartsync::v1::ResourceType type, const std::string& logical_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM resource WHERE type=? AND logical_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(type));
    BindText(st.get(), 2, logical_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, logical_id);
    return result;
}

// ------------------------------------------------------------------
// Reference index
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceReferences(Transaction& t, const std::string& source_uuid,
                                           const std::vector<model::ReferenceRecord>& references) {
    auto* db = TX(t).Handle();

    auto del = Prepare(db, "DELETE FROM resource_reference WHERE source_uuid=?;");
    if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(del.get(), 1, source_uuid);
    auto result = Translate(db, sqlite3_step(del.get()));
    if (!result) return result;

    auto ins = Prepare(db,
        "INSERT INTO resource_reference(source_uuid,relation,target_type,target_id) VALUES(?,?,?,?);");
    if (!ins) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& ref : references) {
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());
        BindText(ins.get(), 1, source_uuid);
        BindText(ins.get(), 2, ref.relation);
        BindI32(ins.get(), 3, static_cast<int>(ref.target_type));
        BindText(ins.get(), 4, ref.target_id);
        result = Translate(db, sqlite3_step(ins.get()));
        if (!result) return result;
    }
    return Result::Ok();
}

std::vector<model::LinkedResourceRecord>
SqliteRepository::GetReferencedResources(Transaction& t, const std::vector<std::string>& source_uuids,
                                         const std::string& relation) {
    auto* db = TX(t).Handle();

    std::vector<model::LinkedResourceRecord> out;
    for (std::size_t begin = 0; begin < source_uuids.size(); begin += kBulkChunk) {
        const auto n = std::min(kBulkChunk, source_uuids.size() - begin);

        const std::string sql =
            "SELECT r.source_uuid,r.relation,r.target_type,r.target_id,"
            "t.uuid,t.type,t.logical_id,t.version_id,t.last_updated_ms,t.json "
            "FROM resource_reference r JOIN resource t ON t.type=r.target_type AND t.logical_id=r.target_id "
            "WHERE r.relation=? AND r.source_uuid IN (" + Placeholders(n, "?") + ") ORDER BY r.source_uuid,r.rowid;";
        auto st = PrepareOrThrow(db, sql.c_str());

        BindText(st.get(), 1, relation);
        for (std::size_t i = 0; i < n; ++i) {
            BindText(st.get(), static_cast<int>(i) + 2, source_uuids[begin + i]);
        }

        while (sqlite3_step(st.get()) == SQLITE_ROW) {
            out.push_back({ReadReference(st.get()), ReadResource(st.get(), 4)});
        }
    }
    return out;
}

std::vector<model::LinkedResourceRecord>
SqliteRepository::GetReferencingResources(Transaction& t, const std::vector<model::ResourceKey>& targets,
                                          const std::string& relation, chartsync::v1::ResourceType source_type) {
    auto* db = TX(t).Handle();

    std::vector<model::LinkedResourceRecord> out;
    for (std::size_t begin = 0; begin < targets.size(); begin += kBulkChunk) {
        const auto n = std::min(kBulkChunk, targets.size() - begin);

        const std::string sql =
            "SELECT r.source_uuid,r.relation,r.target_type,r.target_id,"
            "s.uuid,s.type,s.logical_id,s.version_id,s.last_updated_ms,s.json "
            "FROM resource_reference r JOIN resource s ON s.uuid=r.source_uuid "
            "WHERE r.relation=? AND s.type=? AND (r.target_type,r.target_id) IN (VALUES " + Placeholders(n, "(?,?)") + ") "
            "ORDER BY r.target_type,r.target_id,s.logical_id;";
        auto st = PrepareOrThrow(db, sql.c_str());

        BindText(st.get(), 1, relation);
        BindI32(st.get(), 2, static_cast<int>(source_type));
        for (std::size_t i = 0; i < n; ++i) {
            const auto& target = targets[begin + i];
            BindI32(st.get(), static_cast<int>(2 * i) + 3, static_cast<int>(target.type));
            BindText(st.get(), static_cast<int>(2 * i) + 4, target.logical_id);
        }

        while (sqlite3_step(st.get()) == SQLITE_ROW) {
            out.push_back({ReadReference(st.get()), ReadResource(st.get(), 4)});
        }
    }
    return out;
}

// ------------------------------------------------------------------
// Local change journal
// ------------------------------------------------------------------

Result SqliteRepository::AppendLocalChange(Transaction& t, model::LocalChangeRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO local_change(type,resource_id,change_type,version_id,payload,timestamp_ms) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.type));
    BindText(st.get(), 2, r.resource_id);
    BindI32(st.get(), 3, static_cast<int>(r.change_type));
    BindText(st.get(), 4, r.version_id);
    BindText(st.get(), 5, r.payload_json);
    BindU64(st.get(), 6, r.timestamp_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::LocalChangeRecord> SqliteRepository::ListLocalChanges(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT id,type,resource_id,change_type,version_id,payload,timestamp_ms FROM local_change ORDER BY id;");

    std::vector<model::LocalChangeRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadLocalChange(st.get()));
    }
    return out;
}

std::vector<model::LocalChangeRecord>
SqliteRepository::GetLocalChanges(Transaction& t, chartsync::v1::ResourceType type, const std::string& resource_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db,
        "SELECT id,type,resource_id,change_type,version_id,payload,timestamp_ms FROM local_change "
        "WHERE type=? AND resource_id=? ORDER BY id;");
    BindI32(st.get(), 1, static_cast<int>(type));
    BindText(st.get(), 2, resource_id);

    std::vector<model::LocalChangeRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadLocalChange(st.get()));
    }
    return out;
}

uint64_t SqliteRepository::CountLocalChanges(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, "SELECT COUNT(*) FROM local_change;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

Result SqliteRepository::DeleteLocalChanges(Transaction& t, const std::vector<int64_t>& ids, uint64_t& deleted) {
    auto* db = TX(t).Handle();
    deleted  = 0;

    auto st = Prepare(db, "DELETE FROM local_change WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (auto id : ids) {
        sqlite3_reset(st.get());
        BindI64(st.get(), 1, id);
        auto result = Translate(db, sqlite3_step(st.get()));
        if (!result) return result;
        deleted += static_cast<uint64_t>(sqlite3_changes(db));
    }
    return Result::Ok();
}

Result SqliteRepository::DeleteLocalChangesFor(Transaction& t, chartsync::v1::ResourceType type, const std::string& resource_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM local_change WHERE type=? AND resource_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(type));
    BindText(st.get(), 2, resource_id);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Sync bookkeeping
// ------------------------------------------------------------------

Result SqliteRepository::PutSyncMetadata(Transaction& t, const std::string& key, const std::string& value) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO sync_metadata(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, key);
    BindText(st.get(), 2, value);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<std::string> SqliteRepository::GetSyncMetadata(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, "SELECT value FROM sync_metadata WHERE key=?;");
    BindText(st.get(), 1, key);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ColText(st.get(), 0);
}

Result SqliteRepository::Clear(Transaction& t) {
    auto* db = TX(t).Handle();

    // local_change uses AUTOINCREMENT, so sequence numbers are not reused after a clear
    for (const char* sql : {"DELETE FROM resource_reference;", "DELETE FROM resource;", "DELETE FROM local_change;",
                            "DELETE FROM sync_metadata;"}) {
        auto st = Prepare(db, sql);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        auto result = Translate(db, sqlite3_step(st.get()));
        if (!result) return result;
    }
    return Result::Ok();
}

} // namespace chartsync::db::sqlite
