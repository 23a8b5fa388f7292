#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/upload/resource_consolidator.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace chartsync::v1;
using namespace chartsync::sync::upload;
using chartsync::db::Transaction;

Resource MakePatient(const std::string& id) {
  Resource r;
  r.set_type(RESOURCE_TYPE_PATIENT);
  r.set_logical_id(id);
  (*r.mutable_content()->mutable_fields())["active"].set_bool_value(true);
  return r;
}

struct Fixture {
  std::shared_ptr<chartsync::store::RecordStore> store =
      std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());

  LocalChange CreatePending(const std::string& id) {
    store->WithTransaction([&](Transaction& tx) { store->Insert(tx, {MakePatient(id)}); });
    return store->WithTransaction([&](Transaction& tx) { return store->GetLocalChanges(tx, RESOURCE_TYPE_PATIENT, id).front(); });
  }

  uint64_t Pending() {
    return store->WithTransaction([&](Transaction& tx) { return store->GetLocalChangesCount(tx); });
  }

  Resource Get(const std::string& id) {
    return store->WithTransaction([&](Transaction& tx) { return store->Select(tx, RESOURCE_TYPE_PATIENT, id); });
  }
};

void TestSuccessDropsJournalAndAdoptsRemoteVersion() {
  Fixture f;
  const auto change = f.CreatePending("p1");
  f.CreatePending("p2");

  Resource remote = MakePatient("p1");
  remote.set_version_id("7");
  *remote.mutable_last_updated() = chartsync::util::MillisToProto(1'700'000'000'000ULL);

  DefaultResourceConsolidator consolidator(*f.store);
  consolidator.Consolidate(UploadSuccess{change, remote});

  assert(f.Pending() == 1);
  const auto stored = f.Get("p1");
  assert(stored.version_id() == "7");
  assert(chartsync::util::ToUnixMillis(stored.last_updated()) == 1'700'000'000'000ULL);
  assert(consolidator.Failures().empty());
}

void TestFailureLeavesJournalUntouched() {
  Fixture f;
  const auto change = f.CreatePending("p1");

  DefaultResourceConsolidator consolidator(*f.store);
  consolidator.Consolidate(UploadFailure{change, {UploadErrorCode::kTransport, "unreachable"}});

  assert(f.Pending() == 1);
  const auto still = f.store->WithTransaction([&](Transaction& tx) { return f.store->GetAllLocalChanges(tx).front(); });
  assert(still.token(0) == change.token(0));
  assert(still.type() == change.type());
  assert(f.Get("p1").version_id().empty());

  assert(consolidator.Failures().size() == 1);
  assert(consolidator.Failures()[0].error.message == "unreachable");
}

void TestAlreadyConsolidatedChangeIsIgnored() {
  Fixture f;
  const auto change = f.CreatePending("p1");

  Resource remote = MakePatient("p1");
  remote.set_version_id("2");

  DefaultResourceConsolidator consolidator(*f.store);
  consolidator.Consolidate(UploadSuccess{change, remote});
  assert(f.Get("p1").version_id() == "2");

  // replay with a different remote version: no entries left, nothing applied
  remote.set_version_id("3");
  consolidator.Consolidate(UploadSuccess{change, remote});
  assert(f.Get("p1").version_id() == "2");
  assert(f.Pending() == 0);
}

void TestDeleteSuccessWithoutLocalRow() {
  Fixture f;
  f.CreatePending("p1");
  f.store->WithTransaction([&](Transaction& tx) { f.store->Delete(tx, RESOURCE_TYPE_PATIENT, "p1"); });

  auto changes = f.store->WithTransaction([&](Transaction& tx) { return f.store->GetAllLocalChanges(tx); });
  assert(changes.size() == 2);

  DefaultResourceConsolidator consolidator(*f.store);
  for (const auto& change : changes) {
    consolidator.Consolidate(UploadSuccess{change, std::nullopt});
  }
  assert(f.Pending() == 0);
}

} // namespace

int main() {
  TestSuccessDropsJournalAndAdoptsRemoteVersion();
  TestFailureLeavesJournalUntouched();
  TestAlreadyConsolidatedChangeIsIgnored();
  TestDeleteSuccessWithoutLocalRow();

  std::cout << "chartsync_unit_resource_consolidator: pass\n";
  return 0;
}
