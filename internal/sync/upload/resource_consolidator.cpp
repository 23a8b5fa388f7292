#include "resource_consolidator.hpp"

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"

namespace chartsync::sync::upload {

using namespace chartsync::v1;

DefaultResourceConsolidator::DefaultResourceConsolidator(store::RecordStore& store) : store_(store) {
}

void DefaultResourceConsolidator::Consolidate(const UploadRequestResult& result) {
  if (const auto* success = std::get_if<UploadSuccess>(&result)) {
    OnSuccess(*success);
  } else {
    OnFailure(std::get<UploadFailure>(result));
  }
}

void DefaultResourceConsolidator::OnSuccess(const UploadSuccess& success) {
  const auto& change   = success.local_change;
  const auto  resource = chartsync::model::TypeWithId(change.resource_type(), change.resource_id());

  store_.WithTransaction([&](db::Transaction& tx) {
    const auto deleted = store_.DeleteUpdates(tx, change.token());
    if (deleted < static_cast<uint64_t>(change.token_size())) {
      CHARTSYNC_LOG_WARN("journal inconsistency: uploaded change no longer pending",
                         {observability::StringField("resource", resource),
                          observability::IntField("expected", change.token_size()),
                          observability::IntField("deleted", static_cast<std::int64_t>(deleted))});
      return;
    }

    if (!success.remote || change.type() == CHANGE_TYPE_DELETE) {
      return;
    }

    if (!store_.UpdateVersionIdAndLastUpdated(tx, change.resource_type(), change.resource_id(), success.remote->version_id(),
                                              success.remote->last_updated())) {
      CHARTSYNC_LOG_DEBUG("uploaded resource no longer stored locally", {observability::StringField("resource", resource)});
    }
  });
}

void DefaultResourceConsolidator::OnFailure(const UploadFailure& failure) {
  const auto& change = failure.local_change;
  CHARTSYNC_LOG_WARN("upload failed",
                     {observability::StringField("resource", chartsync::model::TypeWithId(change.resource_type(), change.resource_id())),
                      observability::StringField("code", ToString(failure.error.code)),
                      observability::StringField("error", failure.error.message)});
  failures_.push_back(failure);
}

} // namespace chartsync::sync::upload
