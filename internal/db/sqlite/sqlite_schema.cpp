#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace chartsync::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS resource (uuid TEXT PRIMARY KEY, type INTEGER NOT NULL, logical_id TEXT NOT NULL, version_id TEXT NOT NULL DEFAULT '', last_updated_ms INTEGER NOT NULL, json TEXT NOT NULL, UNIQUE(type, logical_id));",
      "CREATE TABLE IF NOT EXISTS resource_reference (source_uuid TEXT NOT NULL REFERENCES resource(uuid) ON DELETE CASCADE, relation TEXT NOT NULL, target_type INTEGER NOT NULL, target_id TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS resource_reference_source ON resource_reference(source_uuid);",
      "CREATE INDEX IF NOT EXISTS resource_reference_target ON resource_reference(target_type, target_id);",
      "CREATE TABLE IF NOT EXISTS local_change (id INTEGER PRIMARY KEY AUTOINCREMENT, type INTEGER NOT NULL, resource_id TEXT NOT NULL, change_type INTEGER NOT NULL, version_id TEXT NOT NULL DEFAULT '', payload TEXT NOT NULL DEFAULT '', timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS local_change_resource ON local_change(type, resource_id);",
      "CREATE TABLE IF NOT EXISTS sync_metadata (key TEXT PRIMARY KEY, value TEXT NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT uuid,type,logical_id,version_id,last_updated_ms,json FROM resource LIMIT 1;");
  db.Exec("SELECT source_uuid,relation,target_type,target_id FROM resource_reference LIMIT 1;");
  db.Exec("SELECT id,type,resource_id,change_type,version_id,payload,timestamp_ms FROM local_change LIMIT 1;");
  db.Exec("SELECT key,value FROM sync_metadata LIMIT 1;");
}

} // namespace chartsync::db::sqlite
