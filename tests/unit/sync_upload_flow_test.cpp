#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/record_engine.hpp"
#include "internal/sync/upload/sync_upload_flow.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace chartsync::v1;
using namespace chartsync::sync::upload;

Resource MakePatient(const std::string& id) {
  Resource r;
  r.set_type(RESOURCE_TYPE_PATIENT);
  r.set_logical_id(id);
  return r;
}

LocalChange MakeChange(const std::string& id, int64_t seq) {
  LocalChange c;
  c.set_resource_type(RESOURCE_TYPE_PATIENT);
  c.set_resource_id(id);
  c.set_type(CHANGE_TYPE_UPDATE);
  *c.mutable_payload() = MakePatient(id);
  c.add_token(seq);
  return c;
}

// Serves scripted batches and counts how often it is consulted.
class ScriptedFetcher final : public LocalChangeFetcher {
 public:
  explicit ScriptedFetcher(std::vector<std::vector<LocalChange>> batches) : batches_(std::move(batches)) {
    for (const auto& b : batches_) total_ += b.size();
  }

  bool HasNext() override {
    ++has_next_calls;
    return next_ < batches_.size();
  }

  std::vector<LocalChange> Next() override {
    handed_out_ += batches_[next_].size();
    return batches_[next_++];
  }

  uint64_t Total() const override {
    return total_;
  }

  FetchProgress GetProgress() const override {
    return {total_ - handed_out_, total_};
  }

  int has_next_calls = 0;

 private:
  std::vector<std::vector<LocalChange>> batches_;
  size_t                                next_       = 0;
  uint64_t                              total_      = 0;
  uint64_t                              handed_out_ = 0;
};

class RecordingConsolidator final : public ResourceConsolidator {
 public:
  explicit RecordingConsolidator(std::vector<UploadRequestResult>* seen) : seen_(seen) {
  }
  void Consolidate(const UploadRequestResult& result) override {
    seen_->push_back(result);
  }

 private:
  std::vector<UploadRequestResult>* seen_;
};

// Throws on the first result it sees, as a failed store write would.
class ThrowingConsolidator final : public ResourceConsolidator {
 public:
  explicit ThrowingConsolidator(int* calls) : calls_(calls) {
  }
  void Consolidate(const UploadRequestResult&) override {
    ++*calls_;
    throw chartsync::util::TransactionFailure("disk full");
  }

 private:
  int* calls_;
};

// Hands out results one at a time and counts the pulls.
class CountingStream final : public UploadResultStream {
 public:
  CountingStream(std::vector<UploadRequestResult> results, int* pulls) : results_(std::move(results)), pulls_(pulls) {
  }
  std::optional<UploadRequestResult> Next() override {
    ++*pulls_;
    if (next_ >= results_.size()) return std::nullopt;
    return results_[next_++];
  }

 private:
  std::vector<UploadRequestResult> results_;
  size_t                           next_ = 0;
  int*                             pulls_;
};

UploadFn SucceedAll(int* calls) {
  return [calls](const std::vector<LocalChange>& batch) -> std::unique_ptr<UploadResultStream> {
    ++*calls;
    std::vector<UploadRequestResult> results;
    for (const auto& change : batch) {
      auto remote = change.payload();
      remote.set_version_id("2");
      results.push_back(UploadSuccess{change, remote});
    }
    return std::make_unique<VectorUploadResultStream>(std::move(results));
  };
}

void TestProgressIsMonotoneAndJournalDrains() {
  auto store = std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  chartsync::engine::RecordEngine engine(store, {2});
  engine.Create({MakePatient("p1"), MakePatient("p2"), MakePatient("p3"), MakePatient("p4"), MakePatient("p5")});

  int  calls = 0;
  auto flow  = engine.SyncUpload(LocalChangesFetchMode::kFixedSize, SucceedAll(&calls));

  std::vector<SyncUploadProgress> emitted;
  while (auto progress = flow->Next()) {
    emitted.push_back(*progress);
  }

  assert(calls == 3);
  assert(emitted.size() == 6);
  assert(emitted.front().remaining == 5);
  assert(emitted.back().remaining == 0);
  for (size_t i = 0; i < emitted.size(); ++i) {
    assert(emitted[i].initial_total == 5);
    assert(!emitted[i].upload_error.has_value());
    if (i > 0) assert(emitted[i].remaining <= emitted[i - 1].remaining);
  }

  assert(engine.GetUnsyncedLocalChanges().empty());
  assert(engine.Get(RESOURCE_TYPE_PATIENT, "p4").version_id() == "2");
  assert(!flow->Next().has_value());
}

void TestInitialProgressPrecedesTransport() {
  int  supplier_calls = 0;
  int  upload_calls   = 0;
  auto seen           = std::make_shared<std::vector<UploadRequestResult>>();

  SyncUploadFlow flow(
      [&] {
        ++supplier_calls;
        return std::make_unique<ScriptedFetcher>(std::vector<std::vector<LocalChange>>{{MakeChange("p1", 1)}});
      },
      SucceedAll(&upload_calls), std::make_unique<RecordingConsolidator>(seen.get()));

  assert(supplier_calls == 0);

  const auto first = flow.Next();
  assert(first.has_value());
  assert(first->remaining == 1 && first->initial_total == 1);
  assert(supplier_calls == 1);
  assert(upload_calls == 0);

  flow.Cancel();
  assert(!flow.Next().has_value());
  assert(upload_calls == 0);
  assert(seen->empty());
}

void TestFirstFailureStopsTheRun() {
  auto             seen    = std::make_shared<std::vector<UploadRequestResult>>();
  ScriptedFetcher* fetcher = nullptr;
  int              upload_calls = 0;

  const std::vector<std::vector<LocalChange>> batches = {
      {MakeChange("p1", 1)},
      {MakeChange("p2", 2), MakeChange("p3", 3), MakeChange("p4", 4)},
      {MakeChange("p5", 5)},
  };

  UploadFn upload = [&](const std::vector<LocalChange>& batch) -> std::unique_ptr<UploadResultStream> {
    ++upload_calls;
    std::vector<UploadRequestResult> results;
    for (const auto& change : batch) {
      if (change.resource_id() == "p3") {
        results.push_back(UploadFailure{change, {UploadErrorCode::kRejected, "bad payload"}});
      } else {
        results.push_back(UploadSuccess{change, std::nullopt});
      }
    }
    return std::make_unique<VectorUploadResultStream>(std::move(results));
  };

  SyncUploadFlow flow(
      [&] {
        auto f  = std::make_unique<ScriptedFetcher>(batches);
        fetcher = f.get();
        return f;
      },
      upload, std::make_unique<RecordingConsolidator>(seen.get()));

  std::vector<SyncUploadProgress> emitted;
  while (auto progress = flow.Next()) {
    emitted.push_back(*progress);
  }

  // initial, p1, p2, p3 (failure)
  assert(emitted.size() == 4);
  assert(emitted.back().upload_error.has_value());
  assert(emitted.back().upload_error->code == UploadErrorCode::kRejected);
  assert(emitted.back().upload_error->message == "bad payload");
  assert(emitted.back().remaining == 1);

  assert(upload_calls == 2);
  assert(fetcher->has_next_calls == 2);
  assert(seen->size() == 3);
  assert(std::holds_alternative<UploadFailure>(seen->back()));
}

void TestConsolidatorFailureEndsTheRun() {
  int consolidations = 0;
  int pulls          = 0;
  int upload_calls   = 0;

  UploadFn upload = [&](const std::vector<LocalChange>& batch) -> std::unique_ptr<UploadResultStream> {
    ++upload_calls;
    std::vector<UploadRequestResult> results;
    for (const auto& change : batch) results.push_back(UploadSuccess{change, std::nullopt});
    return std::make_unique<CountingStream>(std::move(results), &pulls);
  };

  SyncUploadFlow flow(
      [] {
        return std::make_unique<ScriptedFetcher>(std::vector<std::vector<LocalChange>>{
            {MakeChange("p1", 1), MakeChange("p2", 2), MakeChange("p3", 3)},
            {MakeChange("p4", 4)},
        });
      },
      upload, std::make_unique<ThrowingConsolidator>(&consolidations));

  assert(flow.Next().has_value());

  const auto failed = flow.Next();
  assert(failed.has_value());
  assert(failed->upload_error.has_value());
  assert(failed->upload_error->code == UploadErrorCode::kStorage);
  assert(failed->upload_error->message == "disk full");
  assert(failed->initial_total == 4);

  assert(!flow.Next().has_value());
  assert(!flow.Next().has_value());
  assert(consolidations == 1);
  assert(pulls == 1);
  assert(upload_calls == 1);
}

void TestThrowingTransportEndsTheRun() {
  int  upload_calls = 0;
  auto seen         = std::make_shared<std::vector<UploadRequestResult>>();

  SyncUploadFlow flow(
      [] {
        return std::make_unique<ScriptedFetcher>(
            std::vector<std::vector<LocalChange>>{{MakeChange("p1", 1)}, {MakeChange("p2", 2)}});
      },
      [&](const std::vector<LocalChange>&) -> std::unique_ptr<UploadResultStream> {
        ++upload_calls;
        throw std::runtime_error("connection reset");
      },
      std::make_unique<RecordingConsolidator>(seen.get()));

  assert(flow.Next().has_value());

  const auto failed = flow.Next();
  assert(failed.has_value());
  assert(failed->upload_error.has_value());
  assert(failed->upload_error->code == UploadErrorCode::kTransport);
  assert(failed->upload_error->message == "connection reset");

  assert(!flow.Next().has_value());
  assert(upload_calls == 1);
  assert(seen->empty());
}

} // namespace

int main() {
  TestProgressIsMonotoneAndJournalDrains();
  TestInitialProgressPrecedesTransport();
  TestFirstFailureStopsTheRun();
  TestConsolidatorFailureEndsTheRun();
  TestThrowingTransportEndsTheRun();

  std::cout << "chartsync_unit_sync_upload_flow: pass\n";
  return 0;
}
