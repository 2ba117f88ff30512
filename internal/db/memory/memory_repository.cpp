#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>
#include <functional>

#include "internal/model/embedding.hpp"
#include "memory_tx.hpp"

namespace artscan::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

bool InScope(const model::ArtworkRecord& artwork, const std::vector<int64_t>& museum_scope) {
  if (!artwork.museum_id) return true;
  return std::find(museum_scope.begin(), museum_scope.end(), *artwork.museum_id) != museum_scope.end();
}

template <typename T>
std::vector<T> Page(std::vector<T> rows, const Pagination& pagination) {
  if (pagination.offset >= rows.size()) return {};
  auto first = rows.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  auto last  = rows.end();
  if (pagination.limit > 0 && pagination.limit < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(pagination.limit);
  }
  return std::vector<T>(first, last);
}

} // namespace

MemoryRepository::MemoryRepository(std::size_t embedding_dimension) : embedding_dimension_(embedding_dimension) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

int64_t MemoryRepository::NextId(Table table) {
  std::scoped_lock lock(mutex_);
  return next_ids_[table]++;
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Museums
// ------------------------------------------------------------------

Result MemoryRepository::InsertMuseum(Transaction& t, model::MuseumRecord& r) {
  if (r.name.empty()) return Result::Err(ErrorCode::ConstraintViolation, "museum name is required");
  if (!(r.geofence_radius_meters >= 0.0)) return Result::Err(ErrorCode::ConstraintViolation, "geofence radius must be >= 0");

  r.id = NextId(kMuseums);
  TX(t).Apply([row = r](State& s) { s.museums[row.id] = row; });
  return Result::Ok();
}

std::optional<model::MuseumRecord> MemoryRepository::GetMuseum(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.museums.find(id);
  if (it == s.museums.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MuseumRecord> MemoryRepository::ListMuseums(Transaction& t) {
  std::vector<model::MuseumRecord> out;
  for (const auto& [_, museum] : TX(t).View().museums) {
    out.push_back(museum);
  }
  return out;
}

// ------------------------------------------------------------------
// Artworks
// ------------------------------------------------------------------

Result MemoryRepository::InsertArtwork(Transaction& t, model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;

  if (r.museum_id && !TX(t).View().museums.contains(*r.museum_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "artwork references unknown museum");
  }

  r.id = NextId(kArtworks);
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  r.updated_at_ms = r.created_at_ms;
  TX(t).Apply([row = r](State& s) { s.artworks[row.id] = row; });
  return Result::Ok();
}

std::optional<model::ArtworkRecord> MemoryRepository::GetArtwork(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.artworks.find(id);
  if (it == s.artworks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateArtwork(Transaction& t, const model::ArtworkRecord& r) {
  if (auto valid = model::ValidateArtwork(r, embedding_dimension_); !valid) return valid;

  auto& tx = TX(t);
  tx.Touch(kArtworks, r.id);
  if (!tx.View().artworks.contains(r.id)) return Result::Err(ErrorCode::NotFound);

  auto row          = r;
  row.updated_at_ms = NowMs();
  tx.Apply([row](State& s) {
    if (auto it = s.artworks.find(row.id); it != s.artworks.end()) it->second = row;
  });
  return Result::Ok();
}

Result MemoryRepository::DeleteArtwork(Transaction& t, int64_t id) {
  auto& tx = TX(t);
  tx.Touch(kArtworks, id);
  if (!tx.View().artworks.contains(id)) return Result::Err(ErrorCode::NotFound);

  tx.Apply([id](State& s) {
    s.artworks.erase(id);
    for (auto& scan : s.scans) {
      if (scan.artwork_id == id) scan.artwork_id.reset();
    }
  });
  return Result::Ok();
}

std::size_t MemoryRepository::CountArtworks(Transaction& t) {
  return TX(t).View().artworks.size();
}

std::vector<model::ArtworkCandidate> MemoryRepository::NearestArtworks(Transaction& t, const std::vector<float>& embedding,
                                                                       const std::vector<int64_t>& museum_scope, std::size_t limit) {
  std::vector<model::ArtworkCandidate> out;
  for (const auto& [_, artwork] : TX(t).View().artworks) {
    if (!InScope(artwork, museum_scope) || artwork.embedding.size() != embedding.size()) continue;
    out.push_back({artwork, artscan::model::CosineDistance(embedding, artwork.embedding)});
  }

  std::sort(out.begin(), out.end(), model::RanksBefore);
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::LockCatalogForInsert(Transaction& t) {
  TX(t).HoldUntilEnd(catalog_mutex_);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Scans
// ------------------------------------------------------------------

Result MemoryRepository::LockScansForUser(Transaction& t, const std::string& user_id) {
  TX(t).HoldUntilEnd(scan_user_mutexes_[std::hash<std::string>{}(user_id) % kScanLockStripes]);
  return Result::Ok();
}

Result MemoryRepository::InsertScan(Transaction& t, model::ScanRecord& r) {
  if (r.user_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "scan user_id is required");

  for (const auto& scan : TX(t).View().scans) {
    if (scan.user_id == r.user_id && scan.timestamp_ms == r.timestamp_ms) {
      return Result::Err(ErrorCode::Conflict, "scan timestamp already recorded for user");
    }
  }

  r.id = NextId(kScans);
  TX(t).Apply([row = r](State& s) { s.scans.push_back(row); });
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::LatestScanTimestamp(Transaction& t, const std::string& user_id) {
  std::optional<uint64_t> latest;
  for (const auto& scan : TX(t).View().scans) {
    if (scan.user_id != user_id) continue;
    if (!latest || scan.timestamp_ms > *latest) latest = scan.timestamp_ms;
  }
  return latest;
}

std::vector<model::ScanRecord> MemoryRepository::ListScans(Transaction& t, const std::string& user_id, const Pagination& pagination) {
  std::vector<model::ScanRecord> rows;
  for (const auto& scan : TX(t).View().scans) {
    if (user_id.empty() || scan.user_id == user_id) rows.push_back(scan);
  }
  std::sort(rows.begin(), rows.end(), [](const model::ScanRecord& a, const model::ScanRecord& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
    return a.id > b.id;
  });
  return Page(std::move(rows), pagination);
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result MemoryRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  r.id = NextId(kIssues);
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  TX(t).Apply([row = r](State& s) { s.issues[row.id] = row; });
  return Result::Ok();
}

std::optional<model::IssueRecord> MemoryRepository::GetIssue(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.issues.find(id);
  if (it == s.issues.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  auto& tx = TX(t);
  tx.Touch(kIssues, r.id);
  if (!tx.View().issues.contains(r.id)) return Result::Err(ErrorCode::NotFound);

  tx.Apply([row = r](State& s) {
    if (auto it = s.issues.find(row.id); it != s.issues.end()) it->second = row;
  });
  return Result::Ok();
}

std::vector<model::IssueRecord> MemoryRepository::ListIssues(Transaction& t, std::optional<model::IssueState> state, const Pagination& pagination) {
  std::vector<model::IssueRecord> rows;
  for (const auto& [_, issue] : TX(t).View().issues) {
    if (!state || issue.state == *state) rows.push_back(issue);
  }
  return Page(std::move(rows), pagination);
}

} // namespace artscan::db::memory
