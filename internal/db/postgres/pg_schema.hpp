#pragma once

#include <cstddef>

#include "pg_pool.hpp"

namespace artscan::db::postgres {

// Installs the pgvector extension and the catalog tables. Idempotent.
void BootstrapSchema(PgPool& pool, std::size_t embedding_dimension);

} // namespace artscan::db::postgres
