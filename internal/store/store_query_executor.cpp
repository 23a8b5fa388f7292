#include "store_query_executor.hpp"

#include <iterator>
#include <set>
#include <tuple>

#include "internal/model/resource_type.hpp"
#include "internal/store/resource_codec.hpp"

namespace chartsync::store {

using namespace chartsync::v1;

namespace {

// Walks a dotted path through nested Struct values.
const google::protobuf::Value* Lookup(const google::protobuf::Struct& content, const std::string& path) {
  const google::protobuf::Struct* current = &content;
  std::size_t                     start   = 0;

  while (true) {
    const auto  dot     = path.find('.', start);
    const auto  segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    const auto& fields  = current->fields();
    auto        it      = fields.find(segment);
    if (it == fields.end()) {
      return nullptr;
    }
    if (dot == std::string::npos) {
      return &it->second;
    }
    if (!it->second.has_struct_value()) {
      return nullptr;
    }
    current = &it->second.struct_value();
    start   = dot + 1;
  }
}

bool Matches(const Resource& resource, const std::vector<search::StringFilter>& filters) {
  for (const auto& filter : filters) {
    const auto* value = Lookup(resource.content(), filter.path);
    if (!value || value->kind_case() != google::protobuf::Value::kStringValue || value->string_value() != filter.value) {
      return false;
    }
  }
  return true;
}

} // namespace

StoreQueryExecutor::StoreQueryExecutor(db::Repository& repository, db::Transaction& tx) : repository_(repository), tx_(tx) {
}

std::vector<search::IndexedResource> StoreQueryExecutor::Matching(const search::Search& search) {
  std::vector<search::IndexedResource> out;
  for (const auto& record : repository_.ListResources(tx_, search.type)) {
    auto resource = FromRecord(record);
    if (Matches(resource, search.filters)) {
      out.push_back({record.uuid, std::move(resource)});
    }
  }
  return out;
}

std::vector<search::IndexedResource> StoreQueryExecutor::ExecuteBase(const search::Search& search) {
  auto matching = Matching(search);

  if (search.from >= matching.size()) {
    return {};
  }
  auto first = matching.begin() + static_cast<std::ptrdiff_t>(search.from);
  auto last  = matching.end();
  if (search.count && *search.count < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(*search.count);
  }
  return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

uint64_t StoreQueryExecutor::ExecuteCount(const search::Search& search) {
  return Matching(search).size();
}

std::vector<search::ForwardIncludedResource> StoreQueryExecutor::ExecuteForwardIncludes(const std::vector<search::Include>& includes,
                                                                                        const std::vector<std::string>& base_uuids) {
  std::vector<search::ForwardIncludedResource> out;
  if (base_uuids.empty()) {
    return out;
  }

  // (base uuid, relation, target uuid)
  std::set<std::tuple<std::string, std::string, std::string>> seen;

  for (const auto& include : includes) {
    for (const auto& row : repository_.GetReferencedResources(tx_, base_uuids, include.relation)) {
      if (include.target_type != RESOURCE_TYPE_UNSPECIFIED && row.resource.type != include.target_type) {
        continue;
      }
      if (!seen.emplace(row.reference.source_uuid, include.relation, row.resource.uuid).second) {
        continue;
      }
      out.push_back({row.reference.source_uuid, include.relation, FromRecord(row.resource)});
    }
  }
  return out;
}

std::vector<search::ReverseIncludedResource> StoreQueryExecutor::ExecuteReverseIncludes(
    const std::vector<search::RevInclude>& rev_includes, const std::vector<std::string>& base_type_with_ids) {
  std::vector<search::ReverseIncludedResource> out;

  std::vector<db::model::ResourceKey> targets;
  targets.reserve(base_type_with_ids.size());
  for (const auto& key : base_type_with_ids) {
    const auto slash = key.find('/');
    if (slash == std::string::npos) {
      continue;
    }
    const auto type = chartsync::model::ParseResourceType(std::string_view(key).substr(0, slash));
    if (!type) {
      continue;
    }
    targets.push_back({*type, key.substr(slash + 1)});
  }
  if (targets.empty()) {
    return out;
  }

  // (base key, relation, source uuid)
  std::set<std::tuple<std::string, std::string, std::string>> seen;

  for (const auto& rev : rev_includes) {
    for (const auto& row : repository_.GetReferencingResources(tx_, targets, rev.relation, rev.resource_type)) {
      auto key = chartsync::model::TypeWithId(row.reference.target_type, row.reference.target_id);
      if (!seen.emplace(key, rev.relation, row.resource.uuid).second) {
        continue;
      }
      out.push_back({std::move(key), rev.relation, FromRecord(row.resource)});
    }
  }
  return out;
}

} // namespace chartsync::store
