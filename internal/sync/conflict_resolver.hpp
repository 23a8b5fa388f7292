#pragma once

#include <functional>
#include <variant>

#include "chartsync/v1.hpp"
#include "config/config.pb.h"

namespace chartsync::sync {

/*
  Outcome of reconciling a locally edited resource with its remote version.

  Resolved: `resource` becomes the current value and the local edits for
  that identity are dropped from the journal.
  Unresolved: the local value and its pending edits stay as they are.
*/
struct Resolved {
  chartsync::v1::Resource resource;
};

struct Unresolved {};

using ConflictResolution = std::variant<Resolved, Unresolved>;

using ConflictResolver =
    std::function<ConflictResolution(const chartsync::v1::Resource& local, const chartsync::v1::Resource& remote)>;

// Remote wins.
ConflictResolver AcceptRemoteConflictResolver();

// Local content wins; it is rebased onto the remote version id so the next upload applies cleanly.
ConflictResolver AcceptLocalConflictResolver();

ConflictResolver ResolverForPolicy(chartsync::runtime::config::ConflictPolicy policy);

} // namespace chartsync::sync
