#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace chartsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw chartsync::util::TransactionFailure("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  // optimistic check: another transaction committed since our snapshot
  if (repo_.committed_version_ != snapshot_version_) {
    rolled_back_ = true;
    throw chartsync::util::TransactionFailure("memory transaction conflict: store changed since snapshot");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_     = MemoryRepository::State{};
  rolled_back_ = true;
}

} // namespace chartsync::db::memory
