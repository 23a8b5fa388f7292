#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace chartsync::db::sqlite {

/*
  Owns the single sqlite3 connection of a record store.

  Opened with FULLMUTEX; transactions on it are serialized by the caller.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs statements without result rows: pragmas, DDL, transaction control.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace chartsync::db::sqlite
