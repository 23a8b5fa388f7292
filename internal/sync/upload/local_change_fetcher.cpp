#include "local_change_fetcher.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace chartsync::sync::upload {

using namespace chartsync::v1;

namespace {

using Identity = std::pair<ResourceType, std::string>;

Identity IdentityOf(const LocalChange& change) {
  return {change.resource_type(), change.resource_id()};
}

} // namespace

// ---------------------------------------------------------------------
// Squash
// ---------------------------------------------------------------------

LocalChange Squash(const std::vector<LocalChange>& entries) {
  if (entries.empty()) {
    throw std::invalid_argument("squash requires at least one journal entry");
  }

  const auto& first = entries.front();
  const auto& last  = entries.back();

  LocalChange out;
  out.set_resource_type(first.resource_type());
  out.set_resource_id(first.resource_id());
  out.set_version_id(first.version_id());
  *out.mutable_timestamp() = last.timestamp();

  if (last.type() == CHANGE_TYPE_DELETE) {
    out.set_type(CHANGE_TYPE_DELETE);
  } else {
    out.set_type(first.type() == CHANGE_TYPE_INSERT ? CHANGE_TYPE_INSERT : CHANGE_TYPE_UPDATE);
    *out.mutable_payload() = last.payload();
  }

  for (const auto& entry : entries) {
    out.mutable_token()->MergeFrom(entry.token());
  }
  return out;
}

std::vector<LocalChange> SquashByResource(const std::vector<LocalChange>& entries) {
  std::vector<Identity>                            order;
  std::map<Identity, std::vector<LocalChange>>     grouped;

  for (const auto& entry : entries) {
    auto [it, inserted] = grouped.try_emplace(IdentityOf(entry));
    if (inserted) {
      order.push_back(it->first);
    }
    it->second.push_back(entry);
  }

  std::vector<LocalChange> out;
  out.reserve(order.size());
  for (const auto& id : order) {
    out.push_back(Squash(grouped.at(id)));
  }
  return out;
}

// ---------------------------------------------------------------------
// JournalFetcher
// ---------------------------------------------------------------------

JournalFetcher::JournalFetcher(store::RecordStore& store) : store_(store) {
  total_ = store_.WithTransaction([&](db::Transaction& tx) { return store_.GetLocalChangesCount(tx); });
}

bool JournalFetcher::HasNext() {
  auto entries = store_.WithTransaction([&](db::Transaction& tx) { return store_.GetAllLocalChanges(tx); });

  pending_.clear();
  for (auto& entry : entries) {
    bool fresh = true;
    for (auto id : entry.token()) {
      if (seen_.contains(id)) {
        fresh = false;
        break;
      }
    }
    if (fresh) {
      pending_.push_back(std::move(entry));
    }
  }

  ready_ = !pending_.empty();
  return ready_;
}

std::vector<LocalChange> JournalFetcher::Next() {
  if (!ready_) {
    throw chartsync::util::InvalidState("LocalChangeFetcher::Next called without a pending HasNext");
  }
  ready_ = false;

  auto batch = Take(pending_);
  pending_.clear();

  for (const auto& change : batch) {
    for (auto id : change.token()) {
      if (seen_.insert(id).second) {
        ++handed_out_;
      }
    }
  }
  return batch;
}

uint64_t JournalFetcher::Total() const {
  return total_;
}

FetchProgress JournalFetcher::GetProgress() const {
  return {total_ > handed_out_ ? total_ - handed_out_ : 0, total_};
}

// ---------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------

std::vector<LocalChange> AllChangesFetcher::Take(const std::vector<LocalChange>& pending) {
  return SquashByResource(pending);
}

std::vector<LocalChange> PerResourceFetcher::Take(const std::vector<LocalChange>& pending) {
  const auto               id = IdentityOf(pending.front());
  std::vector<LocalChange> entries;
  for (const auto& entry : pending) {
    if (IdentityOf(entry) == id) {
      entries.push_back(entry);
    }
  }
  return {Squash(entries)};
}

FixedSizeFetcher::FixedSizeFetcher(store::RecordStore& store, uint32_t batch_size)
    : JournalFetcher(store), batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw std::invalid_argument("fixed size fetcher requires a positive batch size");
  }
}

std::vector<LocalChange> FixedSizeFetcher::Take(const std::vector<LocalChange>& pending) {
  const auto n = std::min<std::size_t>(pending.size(), batch_size_);
  return {pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(n)};
}

// ---------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------

std::unique_ptr<LocalChangeFetcher> LocalChangeFetcherFactory::ByMode(LocalChangesFetchMode mode, store::RecordStore& store,
                                                                      uint32_t batch_size) {
  switch (mode) {
    case LocalChangesFetchMode::kAllChanges:
      return std::make_unique<AllChangesFetcher>(store);
    case LocalChangesFetchMode::kPerResource:
      return std::make_unique<PerResourceFetcher>(store);
    case LocalChangesFetchMode::kFixedSize:
      return std::make_unique<FixedSizeFetcher>(store, batch_size);
  }
  throw std::invalid_argument("unknown fetch mode");
}

LocalChangesFetchMode FetchModeFromConfig(chartsync::runtime::config::UploadFetchMode mode) {
  switch (mode) {
    case chartsync::runtime::config::UPLOAD_FETCH_MODE_PER_RESOURCE:
      return LocalChangesFetchMode::kPerResource;
    case chartsync::runtime::config::UPLOAD_FETCH_MODE_FIXED_SIZE:
      return LocalChangesFetchMode::kFixedSize;
    case chartsync::runtime::config::UPLOAD_FETCH_MODE_UNSPECIFIED:
    case chartsync::runtime::config::UPLOAD_FETCH_MODE_ALL_CHANGES:
    default:
      return LocalChangesFetchMode::kAllChanges;
  }
}

} // namespace chartsync::sync::upload
