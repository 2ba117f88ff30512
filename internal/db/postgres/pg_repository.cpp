#include "pg_repository.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>

#include "internal/model/embedding.hpp"

namespace artscan::db::postgres {

namespace {

constexpr const char* kIssueColumns = "id, artwork_id, user_id, kind, note, state, created_at_ms, resolved_at_ms";

// Advisory lock key shared by every artwork-creating transaction.
constexpr int64_t kCatalogInsertLockKey = 0x61727473;

// Class half of the two-key advisory lock taken per scanning user.
constexpr int32_t kScanLedgerLockClass = 0x7363616e;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// pgvector text form: [x1,x2,...]
std::string VectorLiteral(const std::vector<float>& embedding) {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<float>::max_digits10) << '[';
  for (std::size_t i = 0; i < embedding.size(); ++i) {
    if (i > 0) out << ',';
    out << embedding[i];
  }
  out << ']';
  return out.str();
}

std::vector<float> ParseVector(std::string_view text) {
  std::vector<float> out;
  if (text.size() < 2) return out;
  std::string       body(text.substr(1, text.size() - 2));
  std::stringstream in(body);
  std::string       item;
  while (std::getline(in, item, ',')) {
    out.push_back(std::stof(item));
  }
  return out;
}

// Postgres array text form: {1,2,...}
std::string BigintArrayLiteral(const std::vector<int64_t>& ids) {
  std::string out = "{";
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) out += ',';
    out += std::to_string(ids[i]);
  }
  out += '}';
  return out;
}

std::optional<int64_t> PageLimit(const Pagination& pagination) {
  if (pagination.limit == 0) return std::nullopt;
  return static_cast<int64_t>(pagination.limit);
}

model::MuseumRecord ReadMuseum(const pqxx::row& row) {
  model::MuseumRecord r;
  r.id                     = row[0].as<int64_t>();
  r.name                   = row[1].c_str();
  r.latitude               = row[2].as<double>();
  r.longitude              = row[3].as<double>();
  r.geofence_radius_meters = row[4].as<double>();
  return r;
}

model::ArtworkRecord ReadArtwork(const pqxx::row& row) {
  model::ArtworkRecord r;
  r.id = row[0].as<int64_t>();
  if (!row[1].is_null()) r.museum_id = row[1].as<int64_t>();
  r.title            = row[2].c_str();
  r.artist           = row[3].c_str();
  r.description_json = row[4].c_str();
  r.image_url        = row[5].c_str();
  r.embedding        = ParseVector(row[6].c_str());
  r.is_verified      = row[7].as<bool>();
  r.source           = artscan::model::ParseArtworkSource(row[8].c_str()).value_or(artscan::v1::ARTWORK_SOURCE_UNSPECIFIED);
  if (!row[9].is_null()) r.confidence_score = row[9].as<double>();
  r.created_at_ms = static_cast<uint64_t>(row[10].as<int64_t>());
  r.updated_at_ms = static_cast<uint64_t>(row[11].as<int64_t>());
  return r;
}

model::ScanRecord ReadScan(const pqxx::row& row) {
  model::ScanRecord r;
  r.id      = row[0].as<int64_t>();
  r.user_id = row[1].c_str();
  if (!row[2].is_null()) r.artwork_id = row[2].as<int64_t>();
  r.image_url    = row[3].c_str();
  r.status       = artscan::model::ParseScanStatus(row[4].c_str()).value_or(artscan::v1::SCAN_STATUS_UNSPECIFIED);
  r.timestamp_ms = static_cast<uint64_t>(row[5].as<int64_t>());
  return r;
}

model::IssueRecord ReadIssue(const pqxx::row& row) {
  model::IssueRecord r;
  r.id             = row[0].as<int64_t>();
  r.artwork_id     = row[1].as<int64_t>();
  r.user_id        = row[2].c_str();
  r.kind           = artscan::model::ParseIssueKind(row[3].c_str()).value_or(artscan::v1::ISSUE_KIND_UNSPECIFIED);
  r.note           = row[4].c_str();
  r.state          = artscan::model::ParseIssueState(row[5].c_str()).value_or(artscan::v1::ISSUE_STATE_UNSPECIFIED);
  r.created_at_ms  = static_cast<uint64_t>(row[6].as<int64_t>());
  r.resolved_at_ms = static_cast<uint64_t>(row[7].as<int64_t>());
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::size_t embedding_dimension)
    : pool_(std::move(pool)), embedding_dimension_(embedding_dimension) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Museums
// ------------------------------------------------------------------

Result PgRepository::InsertMuseum(Transaction& t, model::MuseumRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO museums(name,latitude,longitude,geofence_radius_meters) VALUES($1,$2,$3,$4) RETURNING id;", r.name, r.latitude,
        r.longitude, r.geofence_radius_meters);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MuseumRecord> PgRepository::GetMuseum(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_params("SELECT id,name,latitude,longitude,geofence_radius_meters FROM museums WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadMuseum(res[0]);
}

std::vector<model::MuseumRecord> PgRepository::ListMuseums(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name,latitude,longitude,geofence_radius_meters FROM museums ORDER BY id;");

  std::vector<model::MuseumRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMuseum(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Artworks
// ------------------------------------------------------------------

Result PgRepository::InsertArtwork(Transaction& t, model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;
  if (r.created_at_ms == 0) r.created_at_ms = static_cast<uint64_t>(NowMs());
  r.updated_at_ms = r.created_at_ms;

  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO artworks(museum_id,title,artist,description_json,image_url,embedding,is_verified,source,confidence_score,"
        "created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4::jsonb,$5,$6::vector,$7,$8,$9,$10,$11) RETURNING id;",
        r.museum_id, r.title, r.artist, r.description_json, r.image_url, VectorLiteral(r.embedding), r.is_verified,
        std::string(artscan::model::ToString(r.source)), r.confidence_score, static_cast<int64_t>(r.created_at_ms),
        static_cast<int64_t>(r.updated_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArtworkRecord> PgRepository::GetArtwork(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_artwork", id);
  if (res.empty()) return std::nullopt;
  return ReadArtwork(res[0]);
}

Result PgRepository::UpdateArtwork(Transaction& t, const model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;

  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE artworks SET museum_id=$2,title=$3,artist=$4,description_json=$5::jsonb,image_url=$6,embedding=$7::vector,is_verified=$8,"
        "source=$9,confidence_score=$10,updated_at_ms=$11 WHERE id=$1;",
        r.id, r.museum_id, r.title, r.artist, r.description_json, r.image_url, VectorLiteral(r.embedding), r.is_verified,
        std::string(artscan::model::ToString(r.source)), r.confidence_score, NowMs());
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteArtwork(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM artworks WHERE id=$1;", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::size_t PgRepository::CountArtworks(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM artworks;");
  return static_cast<std::size_t>(res[0][0].as<int64_t>());
}

std::vector<model::ArtworkCandidate> PgRepository::NearestArtworks(Transaction& t, const std::vector<float>& embedding,
                                                                   const std::vector<int64_t>& museum_scope, std::size_t limit) {
  std::optional<int64_t> row_limit;
  if (limit > 0) row_limit = static_cast<int64_t>(limit);

  auto res = TX(t).Work().exec_prepared("nearest_artworks", VectorLiteral(embedding), BigintArrayLiteral(museum_scope), row_limit);

  std::vector<model::ArtworkCandidate> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({ReadArtwork(row), row[12].as<double>()});
  }

  // server-side float8 rounding can differ from ours on exact ties
  std::stable_sort(out.begin(), out.end(), model::RanksBefore);
  return out;
}

Result PgRepository::LockCatalogForInsert(Transaction& t) {
  try {
    TX(t).Work().exec_params("SELECT pg_advisory_xact_lock($1);", kCatalogInsertLockKey);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Scans
// ------------------------------------------------------------------

Result PgRepository::LockScansForUser(Transaction& t, const std::string& user_id) {
  try {
    TX(t).Work().exec_params("SELECT pg_advisory_xact_lock($1, hashtext($2));", kScanLedgerLockClass, user_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_scan", r.user_id, r.artwork_id, r.image_url,
                                          std::string(artscan::model::ToString(r.status)), static_cast<int64_t>(r.timestamp_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // (user_id, timestamp_ms) taken by a writer that skipped LockScansForUser
    return Result::Err(ErrorCode::Conflict, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<uint64_t> PgRepository::LatestScanTimestamp(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_prepared("latest_scan_timestamp", user_id);
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return static_cast<uint64_t>(res[0][0].as<int64_t>());
}

std::vector<model::ScanRecord> PgRepository::ListScans(Transaction& t, const std::string& user_id, const Pagination& pagination) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,user_id,artwork_id,image_url,status,timestamp_ms FROM user_scans WHERE ($1 = '' OR user_id = $1) "
      "ORDER BY timestamp_ms DESC, id DESC LIMIT $2 OFFSET $3;",
      user_id, PageLimit(pagination), static_cast<int64_t>(pagination.offset));

  std::vector<model::ScanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadScan(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result PgRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = static_cast<uint64_t>(NowMs());

  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO issue_reports(artwork_id,user_id,kind,note,state,created_at_ms,resolved_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7) "
        "RETURNING id;",
        r.artwork_id, r.user_id, std::string(artscan::model::ToString(r.kind)), r.note, std::string(artscan::model::ToString(r.state)),
        static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.resolved_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::IssueRecord> PgRepository::GetIssue(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kIssueColumns + " FROM issue_reports WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadIssue(res[0]);
}

Result PgRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE issue_reports SET kind=$2,note=$3,state=$4,resolved_at_ms=$5 WHERE id=$1;", r.id,
                                        std::string(artscan::model::ToString(r.kind)), r.note,
                                        std::string(artscan::model::ToString(r.state)), static_cast<int64_t>(r.resolved_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::IssueRecord> PgRepository::ListIssues(Transaction& t, std::optional<model::IssueState> state,
                                                         const Pagination& pagination) {
  std::optional<std::string> state_filter;
  if (state) state_filter = std::string(artscan::model::ToString(*state));

  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kIssueColumns +
                                          " FROM issue_reports WHERE ($1::text IS NULL OR state = $1) ORDER BY id ASC LIMIT $2 OFFSET $3;",
                                      state_filter, PageLimit(pagination), static_cast<int64_t>(pagination.offset));

  std::vector<model::IssueRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadIssue(row));
  }
  return out;
}

} // namespace artscan::db::postgres
