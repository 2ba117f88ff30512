#include "auto_catalog_coordinator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/db/api/db_error.hpp"
#include "internal/model/description.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace artscan::catalog {

namespace {

// Records are built here, so a store-side rejection is a server fault.
void RequireStored(const db::Result& result, const char* op) {
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw std::runtime_error(std::string(op) + " rejected by store: " + result.message);
  }
  db::ThrowIfDbError(result, op);
}

} // namespace

using artscan::observability::BoolField;
using artscan::observability::DoubleField;
using artscan::observability::IntField;

AutoCatalogCoordinator::AutoCatalogCoordinator(std::shared_ptr<db::Repository> repository,
                                               std::shared_ptr<recognition::VectorMatchEngine> match_engine,
                                               config::RecognitionSettings settings)
    : repository_(std::move(repository)),
      match_engine_(std::move(match_engine)),
      settings_(settings),
      fingerprinter_(settings.embedding_dimension) {
  if (!repository_ || !match_engine_) {
    throw std::invalid_argument("AutoCatalogCoordinator requires a repository and a match engine");
  }
}

db::model::ArtworkRecord AutoCatalogCoordinator::BuildRecord(const CatalogRequest& request) const {
  db::model::ArtworkRecord record;
  if (request.scope.size() == 1) {
    record.museum_id = request.scope.front();
  }
  record.title            = request.title;
  record.artist           = request.artist;
  record.description_json = model::DescriptionToJson(request.description);
  record.image_url        = request.image_url;
  record.embedding        = request.embedding;
  record.is_verified      = false;
  record.source           = artscan::v1::ARTWORK_SOURCE_AI_GENERATED;
  record.confidence_score = std::clamp(request.confidence, 0.0, 1.0);
  return record;
}

CatalogOutcome AutoCatalogCoordinator::GetOrCreate(const CatalogRequest& request) {
  const auto                  bucket = fingerprinter_.Bucket(request.embedding);
  std::lock_guard<std::mutex> stripe(locks_.For(bucket));

  const uint32_t attempts = std::max<uint32_t>(1, settings_.max_catalog_attempts);
  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    auto tx = repository_->Begin();
    RequireStored(repository_->LockCatalogForInsert(*tx), "catalog lock");

    if (auto existing = match_engine_->Match(*tx, request.embedding, request.scope)) {
      tx->Commit();
      ARTSCAN_LOG_INFO("catalog double-check found existing artwork",
                       {IntField("artwork_id", existing->artwork.id), DoubleField("distance", existing->distance)});
      return {existing->artwork, false, existing->distance};
    }

    auto record = BuildRecord(request);
    try {
      RequireStored(repository_->InsertArtwork(*tx, record), "insert artwork");
      tx->Commit();
    } catch (const util::StoreConflict& e) {
      ARTSCAN_LOG_WARN("catalog insert conflicted", {IntField("attempt", attempt), observability::StringField("error", e.what())});
      observability::Metrics::Instance().RecordCatalogConflict();
      tx.reset();

      if (auto winner = match_engine_->Match(request.embedding, request.scope)) {
        return {winner->artwork, false, winner->distance};
      }
      continue;
    }

    ARTSCAN_LOG_INFO("cataloged new artwork", {IntField("artwork_id", record.id), IntField("bucket", static_cast<int64_t>(bucket)),
                                                BoolField("museum_scoped", record.museum_id.has_value())});
    return {record, true, 0.0};
  }

  ARTSCAN_LOG_WARN("catalog insert gave up", {IntField("attempts", attempts), IntField("bucket", static_cast<int64_t>(bucket))});
  throw util::StoreBusy("catalog insert still conflicting after " + std::to_string(attempts) + " attempts");
}

} // namespace artscan::catalog
