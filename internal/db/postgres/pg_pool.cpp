#include "pg_pool.hpp"

namespace artscan::db::postgres {

namespace {

constexpr const char* kArtworkColumns = "id, museum_id, title, artist, description_json::text, image_url, embedding::text, is_verified, source, "
                                        "confidence_score, created_at_ms, updated_at_ms";

void PrepareCatalogStatements(pqxx::connection& conn) {
  conn.prepare("get_artwork", std::string("SELECT ") + kArtworkColumns + " FROM artworks WHERE id=$1");

  // Cosine distance via pgvector; authoritative sources win exact ties.
  conn.prepare("nearest_artworks", std::string("SELECT ") + kArtworkColumns +
                                       ", (embedding <=> $1::vector) AS distance "
                                       "FROM artworks WHERE museum_id IS NULL OR museum_id = ANY($2::bigint[]) "
                                       "ORDER BY distance ASC, (source IN ('museum_api','admin')) DESC, id ASC LIMIT $3");

  conn.prepare("insert_scan", "INSERT INTO user_scans(user_id, artwork_id, image_url, status, timestamp_ms) VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("latest_scan_timestamp", "SELECT MAX(timestamp_ms) FROM user_scans WHERE user_id=$1");
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), capacity_(max_connections > 0 ? max_connections : 1) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || opened_ < capacity_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++opened_;
  lock.unlock();
  try {
    return Lend(Open());
  } catch (const std::exception&) {
    lock.lock();
    --opened_;
    lock.unlock();
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  PrepareCatalogStatements(*conn);
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    if (auto owner = pool.lock()) {
      owner->GiveBack(lent);
    } else {
      delete lent;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  returned_.notify_one();
}

} // namespace artscan::db::postgres
