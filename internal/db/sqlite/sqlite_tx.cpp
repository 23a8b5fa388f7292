#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chartsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    throw chartsync::util::TransactionFailure(std::string("sqlite begin failed: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    CHARTSYNC_LOG_WARN("sqlite rollback failed",
                       {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw chartsync::util::TransactionFailure("sqlite transaction already finished");
  }
  // on failure the transaction stays open and the destructor rolls it back
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    throw chartsync::util::TransactionFailure(std::string("sqlite commit failed: ") + e.what());
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace chartsync::db::sqlite
