#pragma once

#include <cstdint>

#include "internal/store/record_store.hpp"
#include "internal/sync/conflict_resolver.hpp"
#include "internal/sync/download/download_source.hpp"

namespace chartsync::sync {

struct DownloadSummary {
  uint64_t batches    = 0;
  uint64_t resources  = 0;
  uint64_t conflicts  = 0;
  uint64_t resolved   = 0;
  uint64_t unresolved = 0;

  // Resolved with content that differs from the remote; journaled again for upload.
  uint64_t rejournaled = 0;
};

/*
  Merges remote batches into the record store.

  Each batch is one transaction:
    - identities in the batch that also have journal entries are conflicts
    - conflicts go through the resolver (a locally deleted resource is left unresolved)
    - the batch is written as the synced baseline
    - unresolved identities get their pre-batch local value back
    - resolved identities lose their journal entries and take the resolved value;
      a value that differs from the remote one is journaled as a new UPDATE

  A failing batch is rolled back, the source is cancelled and
  util::TransactionFailure is thrown. Batches committed before it stay.
*/
class DownloadMerger {
 public:
  DownloadMerger(store::RecordStore& store, ConflictResolver resolver);

  DownloadSummary Run(DownloadSource& source);

 private:
  void MergeBatch(const std::vector<chartsync::v1::Resource>& batch, DownloadSummary& summary);

  store::RecordStore& store_;
  ConflictResolver    resolver_;
};

} // namespace chartsync::sync
