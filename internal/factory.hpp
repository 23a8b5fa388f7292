#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/engine/record_engine.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/conflict_resolver.hpp"
#include "internal/sync/upload/local_change_fetcher.hpp"

namespace chartsync::factory {

/*
  Runtime

  Owns the long-lived objects of one process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<store::RecordStore>     store;
  std::shared_ptr<engine::RecordEngine>   engine;

  sync::ConflictResolver              resolver;
  sync::upload::LocalChangesFetchMode fetch_mode = sync::upload::LocalChangesFetchMode::kAllChanges;
};

/*
  Build

  Constructs the storage backend and engine from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime Build(const chartsync::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const chartsync::runtime::config::RuntimeConfig& config);

} // namespace chartsync::factory
