#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace artscan::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS museums ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, latitude REAL NOT NULL, longitude REAL NOT NULL, "
      "geofence_radius_meters REAL NOT NULL CHECK (geofence_radius_meters >= 0));",

      "CREATE TABLE IF NOT EXISTS artworks ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, museum_id INTEGER REFERENCES museums(id), title TEXT NOT NULL CHECK (title <> ''), "
      "artist TEXT NOT NULL DEFAULT '', description_json TEXT NOT NULL DEFAULT '{}', image_url TEXT NOT NULL DEFAULT '', "
      "embedding BLOB NOT NULL, is_verified INTEGER NOT NULL DEFAULT 0, "
      "source TEXT NOT NULL CHECK (source IN ('museum_api','ai_generated','admin','community')), "
      "confidence_score REAL CHECK (confidence_score IS NULL OR (confidence_score >= 0 AND confidence_score <= 1)), "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "CHECK (is_verified = 0 OR source IN ('museum_api','admin')));",

      "CREATE INDEX IF NOT EXISTS artworks_museum_idx ON artworks(museum_id);",

      "CREATE TABLE IF NOT EXISTS user_scans ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, "
      "artwork_id INTEGER REFERENCES artworks(id) ON DELETE SET NULL, image_url TEXT NOT NULL DEFAULT '', "
      "status TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, UNIQUE (user_id, timestamp_ms));",

      "CREATE TABLE IF NOT EXISTS issue_reports ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, artwork_id INTEGER NOT NULL, user_id TEXT NOT NULL, kind TEXT NOT NULL, "
      "note TEXT NOT NULL DEFAULT '', state TEXT NOT NULL, created_at_ms INTEGER NOT NULL, resolved_at_ms INTEGER NOT NULL DEFAULT 0);",

      "CREATE INDEX IF NOT EXISTS issue_reports_state_idx ON issue_reports(state, id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace artscan::db::sqlite
