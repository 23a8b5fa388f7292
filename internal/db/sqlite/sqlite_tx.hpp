#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chartsync::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  The write lock is taken up front, so a download batch never fails
  halfway through on lock upgrade. Only one transaction may be open
  per SqliteDB at a time.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

} // namespace chartsync::db::sqlite
