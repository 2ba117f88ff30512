#pragma once

#include "sqlite_db.hpp"

namespace artscan::db::sqlite {

// Creates the catalog tables if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace artscan::db::sqlite
