#pragma once

namespace chartsync::db {

/*
  Unit of atomicity for the record store.

  A download batch, one consolidated upload result and every engine call
  each map to exactly one Transaction. Backends guarantee:

  - writes are invisible to other transactions until Commit()
  - reads inside the transaction see its own writes
  - Commit() either applies every write or throws util::TransactionFailure
  - Rollback(), or destruction without Commit(), discards every write

  Transactions do not nest. Callers must not Begin() while holding one
  on the same repository.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
};

} // namespace chartsync::db
