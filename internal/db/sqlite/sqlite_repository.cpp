#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>

#include "internal/model/embedding.hpp"

namespace artscan::db::sqlite {

using artscan::db::ErrorCode;
using artscan::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kArtworkColumns =
    "id,museum_id,title,artist,description_json,image_url,embedding,is_verified,source,confidence_score,created_at_ms,updated_at_ms";
constexpr const char* kScanColumns  = "id,user_id,artwork_id,image_url,status,timestamp_ms";
constexpr const char* kIssueColumns = "id,artwork_id,user_id,kind,note,state,created_at_ms,resolved_at_ms";

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindEmbedding(sqlite3_stmt* st, int idx, const std::vector<float>& embedding) {
  sqlite3_bind_blob(st, idx, embedding.data(), static_cast<int>(embedding.size() * sizeof(float)), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

std::vector<float> ColEmbedding(sqlite3_stmt* st, int col) {
  const void* blob  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  std::vector<float> out(static_cast<std::size_t>(bytes) / sizeof(float));
  if (blob && !out.empty()) std::memcpy(out.data(), blob, out.size() * sizeof(float));
  return out;
}

model::MuseumRecord ReadMuseum(sqlite3_stmt* st) {
  model::MuseumRecord r;
  r.id                     = ColI64(st, 0);
  r.name                   = ColText(st, 1);
  r.latitude               = sqlite3_column_double(st, 2);
  r.longitude              = sqlite3_column_double(st, 3);
  r.geofence_radius_meters = sqlite3_column_double(st, 4);
  return r;
}

model::ArtworkRecord ReadArtwork(sqlite3_stmt* st) {
  model::ArtworkRecord r;
  r.id               = ColI64(st, 0);
  r.museum_id        = ColOptionalI64(st, 1);
  r.title            = ColText(st, 2);
  r.artist           = ColText(st, 3);
  r.description_json = ColText(st, 4);
  r.image_url        = ColText(st, 5);
  r.embedding        = ColEmbedding(st, 6);
  r.is_verified      = sqlite3_column_int(st, 7) != 0;
  r.source           = artscan::model::ParseArtworkSource(ColText(st, 8)).value_or(artscan::v1::ARTWORK_SOURCE_UNSPECIFIED);
  if (sqlite3_column_type(st, 9) != SQLITE_NULL) r.confidence_score = sqlite3_column_double(st, 9);
  r.created_at_ms = ColU64(st, 10);
  r.updated_at_ms = ColU64(st, 11);
  return r;
}

model::ScanRecord ReadScan(sqlite3_stmt* st) {
  model::ScanRecord r;
  r.id           = ColI64(st, 0);
  r.user_id      = ColText(st, 1);
  r.artwork_id   = ColOptionalI64(st, 2);
  r.image_url    = ColText(st, 3);
  r.status       = artscan::model::ParseScanStatus(ColText(st, 4)).value_or(artscan::v1::SCAN_STATUS_UNSPECIFIED);
  r.timestamp_ms = ColU64(st, 5);
  return r;
}

model::IssueRecord ReadIssue(sqlite3_stmt* st) {
  model::IssueRecord r;
  r.id             = ColI64(st, 0);
  r.artwork_id     = ColI64(st, 1);
  r.user_id        = ColText(st, 2);
  r.kind           = artscan::model::ParseIssueKind(ColText(st, 3)).value_or(artscan::v1::ISSUE_KIND_UNSPECIFIED);
  r.note           = ColText(st, 4);
  r.state          = artscan::model::ParseIssueState(ColText(st, 5)).value_or(artscan::v1::ISSUE_STATE_UNSPECIFIED);
  r.created_at_ms  = ColU64(st, 6);
  r.resolved_at_ms = ColU64(st, 7);
  return r;
}

void BindPage(sqlite3_stmt* st, int idx, const Pagination& pagination) {
  // LIMIT -1 means unbounded in sqlite
  BindI64(st, idx, pagination.limit == 0 ? -1 : static_cast<int64_t>(pagination.limit));
  BindI64(st, idx + 1, static_cast<int64_t>(pagination.offset));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, std::size_t embedding_dimension)
    : db_(std::move(db)), embedding_dimension_(embedding_dimension) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Museums
// ------------------------------------------------------------------

Result SqliteRepository::InsertMuseum(Transaction& t, model::MuseumRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO museums(name,latitude,longitude,geofence_radius_meters) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.name);
  sqlite3_bind_double(st.get(), 2, r.latitude);
  sqlite3_bind_double(st.get(), 3, r.longitude);
  sqlite3_bind_double(st.get(), 4, r.geofence_radius_meters);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::MuseumRecord> SqliteRepository::GetMuseum(Transaction& t, int64_t id) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,latitude,longitude,geofence_radius_meters FROM museums WHERE id=?;");
  BindI64(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMuseum(st.get());
}

std::vector<model::MuseumRecord> SqliteRepository::ListMuseums(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,latitude,longitude,geofence_radius_meters FROM museums ORDER BY id;");

  std::vector<model::MuseumRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMuseum(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Artworks
// ------------------------------------------------------------------

Result SqliteRepository::InsertArtwork(Transaction& t, model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;
  auto* db = TX(t).Handle();

  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;

  auto st = Prepare(db,
                    "INSERT INTO artworks(museum_id,title,artist,description_json,image_url,embedding,is_verified,source,confidence_score,"
                    "created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  BindOptionalI64(st.get(), 1, r.museum_id);
  BindText(st.get(), 2, r.title);
  BindText(st.get(), 3, r.artist);
  BindText(st.get(), 4, r.description_json);
  BindText(st.get(), 5, r.image_url);
  BindEmbedding(st.get(), 6, r.embedding);
  sqlite3_bind_int(st.get(), 7, r.is_verified ? 1 : 0);
  BindText(st.get(), 8, artscan::model::ToString(r.source));
  if (r.confidence_score) {
    sqlite3_bind_double(st.get(), 9, *r.confidence_score);
  } else {
    sqlite3_bind_null(st.get(), 9);
  }
  BindU64(st.get(), 10, r.created_at_ms);
  BindU64(st.get(), 11, r.updated_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::ArtworkRecord> SqliteRepository::GetArtwork(Transaction& t, int64_t id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kArtworkColumns + " FROM artworks WHERE id=?;");
  BindI64(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadArtwork(st.get());
}

Result SqliteRepository::UpdateArtwork(Transaction& t, const model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE artworks SET museum_id=?,title=?,artist=?,description_json=?,image_url=?,embedding=?,is_verified=?,source=?,"
                    "confidence_score=?,updated_at_ms=? WHERE id=?;");
  BindOptionalI64(st.get(), 1, r.museum_id);
  BindText(st.get(), 2, r.title);
  BindText(st.get(), 3, r.artist);
  BindText(st.get(), 4, r.description_json);
  BindText(st.get(), 5, r.image_url);
  BindEmbedding(st.get(), 6, r.embedding);
  sqlite3_bind_int(st.get(), 7, r.is_verified ? 1 : 0);
  BindText(st.get(), 8, artscan::model::ToString(r.source));
  if (r.confidence_score) {
    sqlite3_bind_double(st.get(), 9, *r.confidence_score);
  } else {
    sqlite3_bind_null(st.get(), 9);
  }
  BindU64(st.get(), 10, NowMs());
  BindI64(st.get(), 11, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::DeleteArtwork(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM artworks WHERE id=?;");
  BindI64(st.get(), 1, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::size_t SqliteRepository::CountArtworks(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT COUNT(*) FROM artworks;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return static_cast<std::size_t>(ColI64(st.get(), 0));
}

std::vector<model::ArtworkCandidate> SqliteRepository::NearestArtworks(Transaction& t, const std::vector<float>& embedding,
                                                                       const std::vector<int64_t>& museum_scope, std::size_t limit) {
  std::string sql = std::string("SELECT ") + kArtworkColumns + " FROM artworks WHERE museum_id IS NULL";
  if (!museum_scope.empty()) {
    sql += " OR museum_id IN (";
    for (std::size_t i = 0; i < museum_scope.size(); ++i) {
      sql += i == 0 ? "?" : ",?";
    }
    sql += ")";
  }
  sql += ";";

  auto st = Prepare(TX(t).Handle(), sql);
  for (std::size_t i = 0; i < museum_scope.size(); ++i) {
    BindI64(st.get(), static_cast<int>(i + 1), museum_scope[i]);
  }

  std::vector<model::ArtworkCandidate> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    auto artwork = ReadArtwork(st.get());
    if (artwork.embedding.size() != embedding.size()) continue;
    const double distance = artscan::model::CosineDistance(embedding, artwork.embedding);
    out.push_back({std::move(artwork), distance});
  }

  std::sort(out.begin(), out.end(), model::RanksBefore);
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result SqliteRepository::LockCatalogForInsert(Transaction&) {
  // BEGIN IMMEDIATE already holds the database write lock
  return Result::Ok();
}

// ------------------------------------------------------------------
// Scans
// ------------------------------------------------------------------

Result SqliteRepository::LockScansForUser(Transaction&, const std::string&) {
  // BEGIN IMMEDIATE already serializes every writer
  return Result::Ok();
}

Result SqliteRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO user_scans(user_id,artwork_id,image_url,status,timestamp_ms) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, r.user_id);
  BindOptionalI64(st.get(), 2, r.artwork_id);
  BindText(st.get(), 3, r.image_url);
  BindText(st.get(), 4, artscan::model::ToString(r.status));
  BindU64(st.get(), 5, r.timestamp_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) {
    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  } else if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
    return Result::Err(ErrorCode::Conflict, result.message);
  }
  return result;
}

std::optional<uint64_t> SqliteRepository::LatestScanTimestamp(Transaction& t, const std::string& user_id) {
  auto st = Prepare(TX(t).Handle(), "SELECT MAX(timestamp_ms) FROM user_scans WHERE user_id=?;");
  BindText(st.get(), 1, user_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW || sqlite3_column_type(st.get(), 0) == SQLITE_NULL) return std::nullopt;
  return ColU64(st.get(), 0);
}

std::vector<model::ScanRecord> SqliteRepository::ListScans(Transaction& t, const std::string& user_id, const Pagination& pagination) {
  std::string sql = std::string("SELECT ") + kScanColumns + " FROM user_scans";
  if (!user_id.empty()) sql += " WHERE user_id=?";
  sql += " ORDER BY timestamp_ms DESC, id DESC LIMIT ? OFFSET ?;";

  auto st  = Prepare(TX(t).Handle(), sql);
  int  idx = 1;
  if (!user_id.empty()) BindText(st.get(), idx++, user_id);
  BindPage(st.get(), idx, pagination);

  std::vector<model::ScanRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadScan(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result SqliteRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  auto* db = TX(t).Handle();
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();

  auto st = Prepare(db, "INSERT INTO issue_reports(artwork_id,user_id,kind,note,state,created_at_ms,resolved_at_ms) VALUES(?,?,?,?,?,?,?);");
  BindI64(st.get(), 1, r.artwork_id);
  BindText(st.get(), 2, r.user_id);
  BindText(st.get(), 3, artscan::model::ToString(r.kind));
  BindText(st.get(), 4, r.note);
  BindText(st.get(), 5, artscan::model::ToString(r.state));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.resolved_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::optional<model::IssueRecord> SqliteRepository::GetIssue(Transaction& t, int64_t id) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kIssueColumns + " FROM issue_reports WHERE id=?;");
  BindI64(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadIssue(st.get());
}

Result SqliteRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE issue_reports SET kind=?,note=?,state=?,resolved_at_ms=? WHERE id=?;");
  BindText(st.get(), 1, artscan::model::ToString(r.kind));
  BindText(st.get(), 2, r.note);
  BindText(st.get(), 3, artscan::model::ToString(r.state));
  BindU64(st.get(), 4, r.resolved_at_ms);
  BindI64(st.get(), 5, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::vector<model::IssueRecord> SqliteRepository::ListIssues(Transaction& t, std::optional<model::IssueState> state,
                                                             const Pagination& pagination) {
  std::string sql = std::string("SELECT ") + kIssueColumns + " FROM issue_reports";
  if (state) sql += " WHERE state=?";
  sql += " ORDER BY id ASC LIMIT ? OFFSET ?;";

  auto st  = Prepare(TX(t).Handle(), sql);
  int  idx = 1;
  if (state) BindText(st.get(), idx++, artscan::model::ToString(*state));
  BindPage(st.get(), idx, pagination);

  std::vector<model::IssueRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadIssue(st.get()));
  }
  return out;
}

} // namespace artscan::db::sqlite
