#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if CHARTSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace chartsync::factory {

std::shared_ptr<db::Repository> BuildRepository(const chartsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CHARTSYNC_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    CHARTSYNC_LOG_INFO("sqlite store opened", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  CHARTSYNC_LOG_INFO("memory store opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Runtime Build(const chartsync::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  runtime.repository = BuildRepository(config);
  runtime.store      = std::make_shared<store::RecordStore>(runtime.repository);

  engine::EngineOptions options;
  options.upload_batch_size = config.sync().upload_batch_size();
  runtime.engine            = std::make_shared<engine::RecordEngine>(runtime.store, options);

  runtime.resolver   = sync::ResolverForPolicy(config.sync().conflict_policy());
  runtime.fetch_mode = sync::upload::FetchModeFromConfig(config.sync().upload_fetch_mode());

  return runtime;
}

} // namespace chartsync::factory
