#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/record_engine.hpp"
#include "internal/search/search_composer.hpp"

namespace {

using namespace chartsync::v1;
using namespace chartsync::search;

Resource MakeResource(ResourceType type, const std::string& id) {
  Resource r;
  r.set_type(type);
  r.set_logical_id(id);
  return r;
}

Resource MakePatient(const std::string& id, const std::string& family, const std::string& city = "") {
  auto r = MakeResource(RESOURCE_TYPE_PATIENT, id);
  auto& fields = *r.mutable_content()->mutable_fields();
  fields["family"].set_string_value(family);
  if (!city.empty()) {
    (*fields["address"].mutable_struct_value()->mutable_fields())["city"].set_string_value(city);
  }
  return r;
}

Resource WithReference(Resource r, const std::string& relation, ResourceType target_type, const std::string& target_id) {
  auto* ref = r.add_references();
  ref->set_relation(relation);
  ref->set_target_type(target_type);
  ref->set_target_id(target_id);
  return r;
}

// Returns canned rows and counts every call.
class CountingExecutor final : public QueryExecutor {
 public:
  std::vector<IndexedResource>         base;
  std::vector<ForwardIncludedResource> forward;
  std::vector<ReverseIncludedResource> reverse;

  int base_calls    = 0;
  int forward_calls = 0;
  int reverse_calls = 0;

  std::vector<std::string> last_base_uuids;
  std::vector<std::string> last_base_keys;

  std::vector<IndexedResource> ExecuteBase(const Search&) override {
    ++base_calls;
    return base;
  }

  std::vector<ForwardIncludedResource> ExecuteForwardIncludes(const std::vector<Include>&,
                                                              const std::vector<std::string>& base_uuids) override {
    ++forward_calls;
    last_base_uuids = base_uuids;
    return forward;
  }

  std::vector<ReverseIncludedResource> ExecuteReverseIncludes(const std::vector<RevInclude>&,
                                                              const std::vector<std::string>& base_type_with_ids) override {
    ++reverse_calls;
    last_base_keys = base_type_with_ids;
    return reverse;
  }

  uint64_t ExecuteCount(const Search&) override {
    return base.size();
  }
};

void TestIncludedResourcesAreSlicedPerBaseRow() {
  CountingExecutor executor;
  executor.base    = {{"uuid-a", MakePatient("A", "Alpha")}, {"uuid-b", MakePatient("B", "Beta")}};
  executor.forward = {{"uuid-a", "subject", MakeResource(RESOURCE_TYPE_OBSERVATION, "X")}};

  Search search;
  search.type             = RESOURCE_TYPE_PATIENT;
  search.forward_includes = {{"subject", RESOURCE_TYPE_OBSERVATION}};

  SearchComposer composer(executor);
  const auto     results = composer.Compose(search);

  assert(results.size() == 2);
  assert(executor.forward_calls == 1);
  assert(executor.reverse_calls == 0);
  assert((executor.last_base_uuids == std::vector<std::string>{"uuid-a", "uuid-b"}));

  assert(results[0].resource.logical_id() == "A");
  assert(results[0].included.has_value());
  assert(results[0].included->at("subject").size() == 1);
  assert(results[0].included->at("subject")[0].logical_id() == "X");
  assert(!results[0].revincluded.has_value());

  assert(results[1].included.has_value());
  assert(results[1].included->empty());
}

void TestReverseIncludesAreGroupedByTypeAndRelation() {
  CountingExecutor executor;
  executor.base    = {{"u1", MakePatient("A", "Alpha")}, {"u2", MakePatient("B", "Beta")}, {"u3", MakePatient("C", "Gamma")}};
  executor.reverse = {
      {"Patient/A", "subject", MakeResource(RESOURCE_TYPE_OBSERVATION, "o1")},
      {"Patient/B", "subject", MakeResource(RESOURCE_TYPE_OBSERVATION, "o2")},
      {"Patient/A", "subject", MakeResource(RESOURCE_TYPE_OBSERVATION, "o3")},
      {"Patient/A", "patient", MakeResource(RESOURCE_TYPE_IMMUNIZATION, "i1")},
  };

  Search search;
  search.type         = RESOURCE_TYPE_PATIENT;
  search.rev_includes = {{RESOURCE_TYPE_OBSERVATION, "subject"}, {RESOURCE_TYPE_IMMUNIZATION, "patient"}};

  SearchComposer composer(executor);
  const auto     results = composer.Compose(search);

  assert(executor.reverse_calls == 1);
  assert((executor.last_base_keys == std::vector<std::string>{"Patient/A", "Patient/B", "Patient/C"}));

  const auto& a = *results[0].revincluded;
  assert(a.size() == 2);
  const auto& a_obs = a.at({RESOURCE_TYPE_OBSERVATION, "subject"});
  assert(a_obs.size() == 2);
  assert(a_obs[0].logical_id() == "o1" && a_obs[1].logical_id() == "o3");
  assert(a.at({RESOURCE_TYPE_IMMUNIZATION, "patient"}).size() == 1);

  assert(results[1].revincluded->at({RESOURCE_TYPE_OBSERVATION, "subject"}).size() == 1);
  assert(results[2].revincluded->empty());
  assert(!results[2].included.has_value());
}

void TestEmptyBaseSkipsIncludeQueries() {
  CountingExecutor executor;

  Search search;
  search.type             = RESOURCE_TYPE_PATIENT;
  search.forward_includes = {{"general-practitioner", RESOURCE_TYPE_UNSPECIFIED}};
  search.rev_includes     = {{RESOURCE_TYPE_OBSERVATION, "subject"}};

  SearchComposer composer(executor);
  assert(composer.Compose(search).empty());
  assert(executor.base_calls == 1);
  assert(executor.forward_calls == 0);
  assert(executor.reverse_calls == 0);
}

void TestStoreBackedSearch() {
  auto store = std::make_shared<chartsync::store::RecordStore>(std::make_shared<chartsync::db::memory::MemoryRepository>());
  chartsync::engine::RecordEngine engine(store);

  engine.Create({
      WithReference(MakePatient("pb", "Beta", "Oslo"), "general-practitioner", RESOURCE_TYPE_PRACTITIONER, "dr1"),
      WithReference(MakePatient("pa", "Alpha", "Oslo"), "general-practitioner", RESOURCE_TYPE_PRACTITIONER, "dr1"),
      MakePatient("pc", "Gamma", "Bergen"),
      MakeResource(RESOURCE_TYPE_PRACTITIONER, "dr1"),
      WithReference(MakeResource(RESOURCE_TYPE_OBSERVATION, "obs1"), "subject", RESOURCE_TYPE_PATIENT, "pa"),
      WithReference(MakeResource(RESOURCE_TYPE_ENCOUNTER, "enc1"), "subject", RESOURCE_TYPE_PATIENT, "pa"),
  });

  Search search;
  search.type             = RESOURCE_TYPE_PATIENT;
  search.filters          = {{"address.city", "Oslo"}};
  search.forward_includes = {{"general-practitioner", RESOURCE_TYPE_PRACTITIONER}};
  search.rev_includes     = {{RESOURCE_TYPE_OBSERVATION, "subject"}};

  const auto results = engine.Search(search);
  assert(results.size() == 2);
  assert(results[0].resource.logical_id() == "pa");
  assert(results[1].resource.logical_id() == "pb");

  assert(results[0].included->at("general-practitioner")[0].logical_id() == "dr1");
  assert(results[1].included->at("general-practitioner")[0].logical_id() == "dr1");

  // the encounter points at pa too, but only observations were requested
  const auto& rev = *results[0].revincluded;
  assert(rev.size() == 1);
  assert(rev.at({RESOURCE_TYPE_OBSERVATION, "subject"})[0].logical_id() == "obs1");
  assert(results[1].revincluded->empty());

  assert(engine.Count(search) == 2);

  search.from  = 1;
  search.count = 5;
  const auto page = engine.Search(search);
  assert(page.size() == 1);
  assert(page[0].resource.logical_id() == "pb");

  Search by_family;
  by_family.type    = RESOURCE_TYPE_PATIENT;
  by_family.filters = {{"family", "Gamma"}};
  assert(engine.Count(by_family) == 1);
}

} // namespace

int main() {
  TestIncludedResourcesAreSlicedPerBaseRow();
  TestReverseIncludesAreGroupedByTypeAndRelation();
  TestEmptyBaseSkipsIncludeQueries();
  TestStoreBackedSearch();

  std::cout << "chartsync_unit_search_composer: pass\n";
  return 0;
}
