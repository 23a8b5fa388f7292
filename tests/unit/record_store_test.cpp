#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/record_engine.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace chartsync::v1;

Resource MakePatient(const std::string& id, const std::string& family) {
  Resource r;
  r.set_type(RESOURCE_TYPE_PATIENT);
  r.set_logical_id(id);
  (*r.mutable_content()->mutable_fields())["family"].set_string_value(family);
  return r;
}

std::string Family(const Resource& r) {
  return r.content().fields().at("family").string_value();
}

chartsync::engine::RecordEngine MakeEngine() {
  auto store = std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  return chartsync::engine::RecordEngine(store);
}

void TestCreateJournalsInsertAndGeneratesIds() {
  auto engine = MakeEngine();

  const auto ids = engine.Create({MakePatient("p1", "Doe"), MakePatient("", "Roe")});
  assert(ids.size() == 2);
  assert(ids[0] == "p1");
  assert(!ids[1].empty());

  assert(Family(engine.Get(RESOURCE_TYPE_PATIENT, ids[1])) == "Roe");

  const auto changes = engine.GetUnsyncedLocalChanges();
  assert(changes.size() == 2);
  assert(changes[0].type() == CHANGE_TYPE_INSERT);
  assert(changes[0].resource_id() == "p1");
  assert(changes[0].token_size() == 1);
  assert(changes[0].token(0) < changes[1].token(0));
  assert(Family(changes[0].payload()) == "Doe");
}

void TestCreateExistingIdentityThrowsAndRollsBack() {
  auto engine = MakeEngine();
  engine.Create({MakePatient("p1", "Doe")});

  bool threw = false;
  try {
    engine.Create({MakePatient("p2", "New"), MakePatient("p1", "Dup")});
  } catch (const chartsync::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  // p2 was part of the failed call
  bool missing = false;
  try {
    (void)engine.Get(RESOURCE_TYPE_PATIENT, "p2");
  } catch (const chartsync::util::NotFound&) {
    missing = true;
  }
  assert(missing);
  assert(engine.GetUnsyncedLocalChanges().size() == 1);
}

void TestUpdateAndDelete() {
  auto engine = MakeEngine();
  engine.Create({MakePatient("p1", "Doe")});
  engine.Update({MakePatient("p1", "Smith")});

  assert(Family(engine.Get(RESOURCE_TYPE_PATIENT, "p1")) == "Smith");

  engine.Delete(RESOURCE_TYPE_PATIENT, "p1");
  engine.Delete(RESOURCE_TYPE_PATIENT, "never-existed");

  const auto changes = engine.GetLocalChanges(RESOURCE_TYPE_PATIENT, "p1");
  assert(changes.size() == 3);
  assert(changes[1].type() == CHANGE_TYPE_UPDATE);
  assert(changes[2].type() == CHANGE_TYPE_DELETE);
  assert(!changes[2].has_payload());
  assert(engine.GetUnsyncedLocalChanges().size() == 3);
}

void TestUpdateMissingThrowsNotFound() {
  auto engine = MakeEngine();
  bool threw  = false;
  try {
    engine.Update({MakePatient("ghost", "X")});
  } catch (const chartsync::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSyncedWritesAreNotJournaled() {
  auto store  = std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  auto remote = MakePatient("p1", "Remote");
  remote.set_version_id("3");

  store->WithTransaction([&](chartsync::db::Transaction& tx) { store->InsertSyncedResources(tx, {remote}); });

  store->WithTransaction([&](chartsync::db::Transaction& tx) {
    assert(store->GetLocalChangesCount(tx) == 0);
    auto stored = store->Select(tx, RESOURCE_TYPE_PATIENT, "p1");
    assert(stored.version_id() == "3");
    assert(stored.has_last_updated());
  });
}

void TestPurgeRespectsPendingChanges() {
  auto engine = MakeEngine();
  engine.Create({MakePatient("p1", "Doe")});

  bool invalid = false;
  try {
    engine.Purge(RESOURCE_TYPE_PATIENT, {"p1"});
  } catch (const chartsync::util::InvalidState&) {
    invalid = true;
  }
  assert(invalid);

  bool not_found = false;
  try {
    engine.Purge(RESOURCE_TYPE_PATIENT, {"p1", "missing"}, true);
  } catch (const chartsync::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  // whole call rolled back
  assert(Family(engine.Get(RESOURCE_TYPE_PATIENT, "p1")) == "Doe");

  engine.Purge(RESOURCE_TYPE_PATIENT, {"p1"}, true);
  assert(engine.GetUnsyncedLocalChanges().empty());

  bool gone = false;
  try {
    (void)engine.Get(RESOURCE_TYPE_PATIENT, "p1");
  } catch (const chartsync::util::NotFound&) {
    gone = true;
  }
  assert(gone);
}

void TestClearAndLastSyncTimestamp() {
  auto engine = MakeEngine();
  assert(!engine.GetLastSyncTimestamp().has_value());

  const auto ts = chartsync::util::FromUnixMillis(1'700'000'000'123ULL);
  engine.SetLastSyncTimestamp(ts);
  assert(engine.GetLastSyncTimestamp() == ts);

  engine.Create({MakePatient("p1", "Doe")});
  engine.ClearDatabase();

  assert(engine.GetUnsyncedLocalChanges().empty());
  assert(!engine.GetLastSyncTimestamp().has_value());
}

void TestDeleteUpdatesByTokenReportsMissingEntries() {
  auto store = std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  store->WithTransaction([&](chartsync::db::Transaction& tx) { store->Insert(tx, {MakePatient("p1", "Doe")}); });

  auto change = store->WithTransaction([&](chartsync::db::Transaction& tx) { return store->GetAllLocalChanges(tx).front(); });

  const auto first  = store->WithTransaction([&](chartsync::db::Transaction& tx) { return store->DeleteUpdates(tx, change.token()); });
  const auto second = store->WithTransaction([&](chartsync::db::Transaction& tx) { return store->DeleteUpdates(tx, change.token()); });
  assert(first == 1);
  assert(second == 0);
}

} // namespace

int main() {
  TestCreateJournalsInsertAndGeneratesIds();
  TestCreateExistingIdentityThrowsAndRollsBack();
  TestUpdateAndDelete();
  TestUpdateMissingThrowsNotFound();
  TestSyncedWritesAreNotJournaled();
  TestPurgeRespectsPendingChanges();
  TestClearAndLastSyncTimestamp();
  TestDeleteUpdatesByTokenReportsMissingEntries();

  std::cout << "chartsync_unit_record_store: pass\n";
  return 0;
}
