#include "sync_upload_flow.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace chartsync::sync::upload {

SyncUploadFlow::SyncUploadFlow(FetcherSupplier fetcher_supplier, UploadFn upload_fn,
                               std::unique_ptr<ResourceConsolidator> consolidator)
    : fetcher_supplier_(std::move(fetcher_supplier)), upload_fn_(std::move(upload_fn)), consolidator_(std::move(consolidator)) {
  if (!fetcher_supplier_ || !upload_fn_ || !consolidator_) {
    throw std::invalid_argument("upload flow requires a fetcher, an upload function and a consolidator");
  }
}

SyncUploadProgress SyncUploadFlow::Progress() const {
  const auto progress = fetcher_->GetProgress();
  return {progress.remaining, progress.initial_total, std::nullopt};
}

std::optional<SyncUploadProgress> SyncUploadFlow::Next() {
  if (done_ || cancelled_) {
    return std::nullopt;
  }

  auto stage = UploadErrorCode::kStorage;
  try {
    return Advance(stage);
  } catch (const std::exception& e) {
    return Abort({stage, e.what()});
  }
}

std::optional<SyncUploadProgress> SyncUploadFlow::Advance(UploadErrorCode& stage) {
  if (!fetcher_) {
    stage    = UploadErrorCode::kStorage;
    fetcher_ = fetcher_supplier_();
    CHARTSYNC_LOG_INFO("upload started", {observability::IntField("pending", static_cast<std::int64_t>(fetcher_->Total()))});
    return Progress();
  }

  while (true) {
    if (stream_) {
      stage       = UploadErrorCode::kTransport;
      auto result = stream_->Next();
      if (!result) {
        stream_.reset();
        continue;
      }

      stage = UploadErrorCode::kStorage;
      consolidator_->Consolidate(*result);
      auto progress = Progress();

      if (const auto* failure = std::get_if<UploadFailure>(&*result)) {
        progress.upload_error = failure->error;
        stream_.reset();
        done_ = true;
      }
      return progress;
    }

    stage = UploadErrorCode::kStorage;
    if (cancelled_ || !fetcher_->HasNext()) {
      done_ = true;
      CHARTSYNC_LOG_INFO("upload finished", {observability::IntField("remaining", static_cast<std::int64_t>(Progress().remaining))});
      return std::nullopt;
    }

    auto batch = fetcher_->Next();
    stage      = UploadErrorCode::kTransport;
    stream_    = upload_fn_(batch);
  }
}

SyncUploadProgress SyncUploadFlow::Abort(UploadError error) {
  done_ = true;
  stream_.reset();
  CHARTSYNC_LOG_ERROR("upload aborted",
                      {observability::StringField("code", ToString(error.code)), observability::StringField("error", error.message)});

  auto progress         = fetcher_ ? Progress() : SyncUploadProgress{};
  progress.upload_error = std::move(error);
  return progress;
}

} // namespace chartsync::sync::upload
