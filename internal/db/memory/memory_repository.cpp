#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_set>

#include "memory_tx.hpp"

namespace chartsync::db::memory {

namespace {

std::string ResourceKey(chartsync::v1::ResourceType type, const std::string& logical_id) {
  return std::to_string(static_cast<int>(type)) + "/" + logical_id;
}

std::string TypePrefix(chartsync::v1::ResourceType type) {
  return std::to_string(static_cast<int>(type)) + "/";
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result MemoryRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = ResourceKey(r.type, r.logical_id);
  if (s.resources.contains(key)) return Result::Err(ErrorCode::AlreadyExists, key);
  if (s.uuid_to_key.contains(r.uuid)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate uuid " + r.uuid);
  s.resources[key]        = r;
  s.uuid_to_key[r.uuid]   = key;
  return Result::Ok();
}

Result MemoryRepository::UpsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = ResourceKey(r.type, r.logical_id);
  auto       it  = s.resources.find(key);
  if (it == s.resources.end()) {
    return InsertResource(t, r);
  }
  const auto uuid = it->second.uuid;
  it->second      = r;
  it->second.uuid = uuid;
  return Result::Ok();
}

Result MemoryRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.resources.find(ResourceKey(r.type, r.logical_id));
  if (it == s.resources.end()) return Result::Err(ErrorCode::NotFound);
  const auto uuid = it->second.uuid;
  it->second      = r;
  it->second.uuid = uuid;
  return Result::Ok();
}

std::optional<model::ResourceRecord> MemoryRepository::GetResource(Transaction& t, chartsync::v1::ResourceType type,
                                                                   const std::string& logical_id) {
  const auto& s  = TX(t).View();
  auto        it = s.resources.find(ResourceKey(type, logical_id));
  if (it == s.resources.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ResourceRecord> MemoryRepository::GetResourceByUuid(Transaction& t, const std::string& uuid) {
  const auto& s   = TX(t).View();
  auto        key = s.uuid_to_key.find(uuid);
  if (key == s.uuid_to_key.end()) return std::nullopt;
  return s.resources.at(key->second);
}

std::vector<model::ResourceRecord> MemoryRepository::ListResources(Transaction& t, chartsync::v1::ResourceType type) {
  const auto&                        s      = TX(t).View();
  const auto                         prefix = TypePrefix(type);
  std::vector<model::ResourceRecord> out;
  for (auto it = s.resources.lower_bound(prefix); it != s.resources.end() && it->first.starts_with(prefix); ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteResource(Transaction& t, chartsync::v1::ResourceType type, const std::string& logical_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.resources.find(ResourceKey(type, logical_id));
  if (it == s.resources.end()) return Result::Err(ErrorCode::NotFound);
  s.references.erase(it->second.uuid);
  s.uuid_to_key.erase(it->second.uuid);
  s.resources.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Reference index
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceReferences(Transaction& t, const std::string& source_uuid,
                                           const std::vector<model::ReferenceRecord>& references) {
  auto& s = TX(t).Mutable();
  if (!s.uuid_to_key.contains(source_uuid)) return Result::Err(ErrorCode::NotFound, source_uuid);
  if (references.empty()) {
    s.references.erase(source_uuid);
  } else {
    s.references[source_uuid] = references;
  }
  return Result::Ok();
}

std::vector<model::LinkedResourceRecord> MemoryRepository::GetReferencedResources(Transaction& t,
                                                                                 const std::vector<std::string>& source_uuids,
                                                                                 const std::string&              relation) {
  const auto&                              s = TX(t).View();
  std::vector<model::LinkedResourceRecord> out;
  for (const auto& uuid : source_uuids) {
    auto refs = s.references.find(uuid);
    if (refs == s.references.end()) continue;
    for (const auto& ref : refs->second) {
      if (ref.relation != relation) continue;
      auto target = s.resources.find(ResourceKey(ref.target_type, ref.target_id));
      if (target == s.resources.end()) continue;
      out.push_back({ref, target->second});
    }
  }
  return out;
}

std::vector<model::LinkedResourceRecord> MemoryRepository::GetReferencingResources(Transaction& t,
                                                                                  const std::vector<model::ResourceKey>& targets,
                                                                                  const std::string&          relation,
                                                                                  chartsync::v1::ResourceType source_type) {
  const auto&                     s = TX(t).View();
  std::unordered_set<std::string> wanted;
  for (const auto& target : targets) wanted.insert(ResourceKey(target.type, target.logical_id));

  std::vector<model::LinkedResourceRecord> out;
  for (const auto& [source_uuid, refs] : s.references) {
    const auto& source = s.resources.at(s.uuid_to_key.at(source_uuid));
    if (source.type != source_type) continue;
    for (const auto& ref : refs) {
      if (ref.relation == relation && wanted.contains(ResourceKey(ref.target_type, ref.target_id))) {
        out.push_back({ref, source});
      }
    }
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.reference.target_type, a.reference.target_id, a.resource.logical_id) <
           std::tie(b.reference.target_type, b.reference.target_id, b.resource.logical_id);
  });
  return out;
}

// ------------------------------------------------------------------
// Local change journal
// ------------------------------------------------------------------

Result MemoryRepository::AppendLocalChange(Transaction& t, model::LocalChangeRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_local_change_id++;
  s.local_changes[r.id] = r;
  return Result::Ok();
}

std::vector<model::LocalChangeRecord> MemoryRepository::ListLocalChanges(Transaction& t) {
  const auto&                           s = TX(t).View();
  std::vector<model::LocalChangeRecord> out;
  out.reserve(s.local_changes.size());
  for (const auto& [_, change] : s.local_changes) {
    out.push_back(change);
  }
  return out;
}

std::vector<model::LocalChangeRecord> MemoryRepository::GetLocalChanges(Transaction& t, chartsync::v1::ResourceType type,
                                                                        const std::string& resource_id) {
  std::vector<model::LocalChangeRecord> out;
  for (const auto& [_, change] : TX(t).View().local_changes)
    if (change.type == type && change.resource_id == resource_id) out.push_back(change);
  return out;
}

uint64_t MemoryRepository::CountLocalChanges(Transaction& t) {
  return TX(t).View().local_changes.size();
}

Result MemoryRepository::DeleteLocalChanges(Transaction& t, const std::vector<int64_t>& ids, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;
  for (auto id : ids) {
    deleted += s.local_changes.erase(id);
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteLocalChangesFor(Transaction& t, chartsync::v1::ResourceType type, const std::string& resource_id) {
  auto& changes = TX(t).Mutable().local_changes;
  std::erase_if(changes, [&](const auto& entry) {
    return entry.second.type == type && entry.second.resource_id == resource_id;
  });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sync bookkeeping
// ------------------------------------------------------------------

Result MemoryRepository::PutSyncMetadata(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().sync_metadata[key] = value;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetSyncMetadata(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.sync_metadata.find(key);
  if (it == s.sync_metadata.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::Clear(Transaction& t) {
  auto& s = TX(t).Mutable();
  // sequence numbers keep growing across a clear
  const auto next_id      = s.next_local_change_id;
  s                       = State{};
  s.next_local_change_id  = next_id;
  return Result::Ok();
}

} // namespace chartsync::db::memory
