#include "conflict_resolver.hpp"

#include <stdexcept>

namespace chartsync::sync {

ConflictResolver AcceptRemoteConflictResolver() {
  return [](const chartsync::v1::Resource&, const chartsync::v1::Resource& remote) -> ConflictResolution {
    return Resolved{remote};
  };
}

ConflictResolver AcceptLocalConflictResolver() {
  return [](const chartsync::v1::Resource& local, const chartsync::v1::Resource& remote) -> ConflictResolution {
    chartsync::v1::Resource merged = local;
    merged.set_version_id(remote.version_id());
    *merged.mutable_last_updated() = remote.last_updated();
    return Resolved{std::move(merged)};
  };
}

ConflictResolver ResolverForPolicy(chartsync::runtime::config::ConflictPolicy policy) {
  switch (policy) {
    case chartsync::runtime::config::CONFLICT_POLICY_UNSPECIFIED:
    case chartsync::runtime::config::CONFLICT_POLICY_ACCEPT_REMOTE:
      return AcceptRemoteConflictResolver();
    case chartsync::runtime::config::CONFLICT_POLICY_ACCEPT_LOCAL:
      return AcceptLocalConflictResolver();
    default:
      throw std::invalid_argument("unknown conflict policy");
  }
}

} // namespace chartsync::sync
