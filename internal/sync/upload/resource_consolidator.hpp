#pragma once

#include <vector>

#include "internal/store/record_store.hpp"
#include "internal/sync/upload/upload_request_result.hpp"

namespace chartsync::sync::upload {

/*
  Applies one upload outcome back onto the record store.
*/
class ResourceConsolidator {
 public:
  virtual ~ResourceConsolidator() = default;

  virtual void Consolidate(const UploadRequestResult& result) = 0;
};

/*
  Success: the change's journal entries are dropped and, unless the change
  was a delete, the local resource adopts the remote version id and
  last_updated. Entries that are already gone are logged and skipped.

  Failure: the journal is left alone so the change is retried next run.
*/
class DefaultResourceConsolidator final : public ResourceConsolidator {
 public:
  explicit DefaultResourceConsolidator(store::RecordStore& store);

  void Consolidate(const UploadRequestResult& result) override;

  const std::vector<UploadFailure>& Failures() const {
    return failures_;
  }

 private:
  void OnSuccess(const UploadSuccess& success);
  void OnFailure(const UploadFailure& failure);

  store::RecordStore&        store_;
  std::vector<UploadFailure> failures_;
};

} // namespace chartsync::sync::upload
