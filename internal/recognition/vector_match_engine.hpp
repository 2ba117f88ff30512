#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/config/recognition_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/enums.hpp"

namespace artscan::recognition {

struct MatchResult {
  model::MatchTier          tier = artscan::v1::MATCH_TIER_UNSPECIFIED;
  db::model::ArtworkRecord  artwork;
  double                    distance = 0.0;
};

/*
  VectorMatchEngine

  Nearest-neighbour lookup with the distance threshold applied.

  Scope: artworks of the scoped museums plus unaffiliated artworks; an
  empty scope searches unaffiliated artworks only. A candidate qualifies
  when distance < threshold. Read-only.
*/
class VectorMatchEngine {
 public:
  VectorMatchEngine(std::shared_ptr<db::Repository> repository, config::RecognitionSettings settings);

  // Runs in its own read transaction.
  std::optional<MatchResult> Match(const std::vector<float>& embedding, const std::vector<int64_t>& scope) const;

  // Runs inside the caller's transaction (catalog double-check).
  std::optional<MatchResult> Match(db::Transaction& tx, const std::vector<float>& embedding, const std::vector<int64_t>& scope) const;

  double Threshold() const {
    return settings_.distance_threshold;
  }

  static model::MatchTier TierOf(const db::model::ArtworkRecord& artwork);

 private:
  std::shared_ptr<db::Repository> repository_;
  config::RecognitionSettings     settings_;
};

} // namespace artscan::recognition
