#include "download_merger.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <set>
#include <stdexcept>
#include <utility>

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chartsync::sync {

using namespace chartsync::v1;

namespace {

using Identity = std::pair<ResourceType, std::string>;

struct PendingRestore {
  Identity                id;
  std::optional<Resource> snapshot;
};

struct PendingResolution {
  Resource        resource;
  const Resource* remote = nullptr;
};

// True when `resolved` carries exactly the remote content and references.
bool SameAsRemote(const Resource& resolved, const Resource& remote) {
  using google::protobuf::util::MessageDifferencer;
  if (!MessageDifferencer::Equals(resolved.content(), remote.content())) {
    return false;
  }
  if (resolved.references_size() != remote.references_size()) {
    return false;
  }
  for (int i = 0; i < resolved.references_size(); ++i) {
    if (!MessageDifferencer::Equals(resolved.references(i), remote.references(i))) {
      return false;
    }
  }
  return true;
}

} // namespace

DownloadMerger::DownloadMerger(store::RecordStore& store, ConflictResolver resolver)
    : store_(store), resolver_(std::move(resolver)) {
  if (!resolver_) {
    throw std::invalid_argument("download merger requires a conflict resolver");
  }
}

DownloadSummary DownloadMerger::Run(DownloadSource& source) {
  DownloadSummary summary;

  while (auto batch = source.Next()) {
    try {
      MergeBatch(*batch, summary);
    } catch (const std::exception& e) {
      source.Cancel();
      CHARTSYNC_LOG_ERROR("download batch rolled back",
                          {observability::IntField("batch", static_cast<std::int64_t>(summary.batches)),
                           observability::IntField("resources", static_cast<std::int64_t>(batch->size())),
                           observability::StringField("error", e.what())});
      if (dynamic_cast<const chartsync::util::TransactionFailure*>(&e)) {
        throw;
      }
      throw chartsync::util::TransactionFailure(std::string("download batch failed: ") + e.what());
    }
  }

  CHARTSYNC_LOG_INFO("download finished",
                     {observability::IntField("batches", static_cast<std::int64_t>(summary.batches)),
                      observability::IntField("resources", static_cast<std::int64_t>(summary.resources)),
                      observability::IntField("conflicts", static_cast<std::int64_t>(summary.conflicts))});
  return summary;
}

void DownloadMerger::MergeBatch(const std::vector<Resource>& batch, DownloadSummary& summary) {
  DownloadSummary delta;

  store_.WithTransaction([&](db::Transaction& tx) {
    std::set<Identity> changed;
    for (const auto& change : store_.GetAllLocalChanges(tx)) {
      changed.emplace(change.resource_type(), change.resource_id());
    }

    std::vector<PendingResolution> resolved;
    std::vector<PendingRestore>    restores;
    std::set<Identity>             handled;

    for (const auto& remote : batch) {
      Identity id{remote.type(), remote.logical_id()};
      if (!changed.contains(id) || !handled.insert(id).second) {
        continue;
      }
      ++delta.conflicts;

      auto local = store_.Find(tx, id.first, id.second);
      if (!local) {
        restores.push_back({id, std::nullopt});
        continue;
      }

      auto outcome = resolver_(*local, remote);
      if (auto* r = std::get_if<Resolved>(&outcome)) {
        r->resource.set_type(id.first);
        r->resource.set_logical_id(id.second);
        resolved.push_back({std::move(r->resource), &remote});
      } else {
        restores.push_back({id, std::move(local)});
      }
    }

    store_.InsertSyncedResources(tx, batch);

    for (const auto& restore : restores) {
      store_.Restore(tx, restore.id.first, restore.id.second, restore.snapshot);
      CHARTSYNC_LOG_INFO("conflict left unresolved",
                         {observability::StringField("resource", chartsync::model::TypeWithId(restore.id.first, restore.id.second))});
    }

    for (const auto& resolution : resolved) {
      const std::vector<Resource> one{resolution.resource};
      store_.DeleteUpdates(tx, one);
      store_.InsertSyncedResources(tx, one);

      // Content the server does not have yet goes back into the journal as an
      // edit on top of the remote version, so the next upload carries it.
      if (!SameAsRemote(resolution.resource, *resolution.remote)) {
        store_.Update(tx, one);
        ++delta.rejournaled;
      }
    }

    delta.resolved   = resolved.size();
    delta.unresolved = restores.size();
  });

  ++summary.batches;
  summary.resources += batch.size();
  summary.conflicts += delta.conflicts;
  summary.resolved += delta.resolved;
  summary.unresolved += delta.unresolved;
  summary.rejournaled += delta.rejournaled;

  CHARTSYNC_LOG_DEBUG("download batch committed",
                      {observability::IntField("resources", static_cast<std::int64_t>(batch.size())),
                       observability::IntField("resolved", static_cast<std::int64_t>(delta.resolved)),
                       observability::IntField("unresolved", static_cast<std::int64_t>(delta.unresolved)),
                       observability::IntField("rejournaled", static_cast<std::int64_t>(delta.rejournaled))});
}

} // namespace chartsync::sync
