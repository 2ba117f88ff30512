#include "pg_schema.hpp"

#include <string>

namespace artscan::db::postgres {

void BootstrapSchema(PgPool& pool, std::size_t embedding_dimension) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  const std::string vector_type = embedding_dimension > 0 ? "vector(" + std::to_string(embedding_dimension) + ")" : "vector";

  tx.exec("CREATE EXTENSION IF NOT EXISTS vector;");
  tx.exec("CREATE TABLE IF NOT EXISTS museums (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, latitude DOUBLE PRECISION NOT NULL, "
          "longitude DOUBLE PRECISION NOT NULL, geofence_radius_meters DOUBLE PRECISION NOT NULL CHECK (geofence_radius_meters >= 0));");
  tx.exec("CREATE TABLE IF NOT EXISTS artworks (id BIGSERIAL PRIMARY KEY, museum_id BIGINT REFERENCES museums(id), "
          "title TEXT NOT NULL CHECK (title <> ''), artist TEXT NOT NULL DEFAULT '', description_json JSONB NOT NULL DEFAULT '{}', "
          "image_url TEXT NOT NULL DEFAULT '', embedding " +
          vector_type +
          " NOT NULL, is_verified BOOLEAN NOT NULL DEFAULT FALSE, "
          "source TEXT NOT NULL CHECK (source IN ('museum_api','ai_generated','admin','community')), "
          "confidence_score DOUBLE PRECISION CHECK (confidence_score IS NULL OR (confidence_score >= 0 AND confidence_score <= 1)), "
          "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
          "CHECK (NOT is_verified OR source IN ('museum_api','admin')));");
  tx.exec("CREATE INDEX IF NOT EXISTS artworks_museum_idx ON artworks(museum_id);");
  // hnsw needs a fixed-dimension column
  if (embedding_dimension > 0) {
    tx.exec("CREATE INDEX IF NOT EXISTS artworks_embedding_idx ON artworks USING hnsw (embedding vector_cosine_ops);");
  }
  tx.exec("CREATE TABLE IF NOT EXISTS user_scans (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, "
          "artwork_id BIGINT REFERENCES artworks(id) ON DELETE SET NULL, image_url TEXT NOT NULL DEFAULT '', status TEXT NOT NULL, "
          "timestamp_ms BIGINT NOT NULL, UNIQUE (user_id, timestamp_ms));");
  tx.exec("CREATE TABLE IF NOT EXISTS issue_reports (id BIGSERIAL PRIMARY KEY, artwork_id BIGINT NOT NULL, user_id TEXT NOT NULL, "
          "kind TEXT NOT NULL, note TEXT NOT NULL DEFAULT '', state TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
          "resolved_at_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS issue_reports_state_idx ON issue_reports(state, id);");
  tx.commit();
}

} // namespace artscan::db::postgres
