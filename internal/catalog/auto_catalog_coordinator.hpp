#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/fingerprint.hpp"
#include "internal/config/recognition_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/recognition/vector_match_engine.hpp"

namespace artscan::catalog {

struct CatalogRequest {
  std::vector<float>                 embedding;  // normalized, gateway dimension
  std::string                        title;
  std::string                        artist;
  std::map<std::string, std::string> description;
  double                             confidence = 0.0;
  std::string                        image_url;
  std::vector<int64_t>               scope;
};

struct CatalogOutcome {
  db::model::ArtworkRecord artwork;
  bool                     created  = false;
  double                   distance = 0.0;
};

/*
  AutoCatalogCoordinator

  Sole writer of ai_generated artworks. For any set of concurrent
  requests whose embeddings lie within the match threshold of each other
  at most one artwork is created; every request resolves to it.

  Per request:
    fingerprint stripe lock
      -> store transaction + LockCatalogForInsert
      -> double-check match inside the transaction
      -> insert unverified ai_generated row
      -> commit; on StoreConflict re-query the winner or retry

  StoreConflict never escapes GetOrCreate. Exhausted retries throw
  util::StoreBusy; a store rejection of the built record is internal.
*/
class AutoCatalogCoordinator {
 public:
  AutoCatalogCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<recognition::VectorMatchEngine> match_engine,
                         config::RecognitionSettings settings);

  CatalogOutcome GetOrCreate(const CatalogRequest& request);

 private:
  db::model::ArtworkRecord BuildRecord(const CatalogRequest& request) const;

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<recognition::VectorMatchEngine> match_engine_;
  config::RecognitionSettings                     settings_;
  Fingerprinter                                   fingerprinter_;
  FingerprintLockTable                            locks_;
};

} // namespace artscan::catalog
