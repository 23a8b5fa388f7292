#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "internal/sync/upload/local_change_fetcher.hpp"
#include "internal/sync/upload/resource_consolidator.hpp"
#include "internal/sync/upload/sync_upload_progress.hpp"
#include "internal/sync/upload/upload_transport.hpp"

namespace chartsync::sync::upload {

using FetcherSupplier = std::function<std::unique_ptr<LocalChangeFetcher>()>;

/*
  Lazy upload run.

  Nothing happens until the first Next(). That call builds the fetcher and
  returns {total, total} before any transport call. Each later Next()
  advances to the next upload result, consolidates it and returns the
  fetcher progress, with the error attached for a failure.

  The run ends after the first failure (no retry) and once the fetcher is
  drained. Cancel() ends it at the next pull. An exception from the
  journal, the transport or the consolidator also ends it: the last
  progress carries the error instead of the exception.
*/
class SyncUploadFlow {
 public:
  SyncUploadFlow(FetcherSupplier fetcher_supplier, UploadFn upload_fn, std::unique_ptr<ResourceConsolidator> consolidator);

  std::optional<SyncUploadProgress> Next();

  void Cancel() {
    cancelled_ = true;
  }

 private:
  SyncUploadProgress                Progress() const;
  std::optional<SyncUploadProgress> Advance(UploadErrorCode& stage);
  SyncUploadProgress                Abort(UploadError error);

  FetcherSupplier                       fetcher_supplier_;
  UploadFn                              upload_fn_;
  std::unique_ptr<ResourceConsolidator> consolidator_;

  std::unique_ptr<LocalChangeFetcher> fetcher_;
  std::unique_ptr<UploadResultStream> stream_;

  bool done_      = false;
  bool cancelled_ = false;
};

} // namespace chartsync::sync::upload
