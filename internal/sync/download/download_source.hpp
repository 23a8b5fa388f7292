#pragma once

#include <optional>
#include <vector>

#include "chartsync/v1.hpp"

namespace chartsync::sync {

/*
  Pull-based producer of remote resource batches.

  Next() blocks until a batch is available and returns nullopt once the
  source is exhausted or cancelled. Only one batch is in flight at a time.
*/
class DownloadSource {
 public:
  virtual ~DownloadSource() = default;

  virtual std::optional<std::vector<chartsync::v1::Resource>> Next() = 0;

  // Stops production; subsequent Next() calls return nullopt.
  virtual void Cancel() = 0;
};

} // namespace chartsync::sync
