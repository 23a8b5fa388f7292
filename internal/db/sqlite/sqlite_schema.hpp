#pragma once

#include "sqlite_db.hpp"

namespace chartsync::db::sqlite {

// Creates the resource, reference index, journal and sync metadata tables if missing.
void BootstrapSchema(SqliteDB& db);

} // namespace chartsync::db::sqlite
