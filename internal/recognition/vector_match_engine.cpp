#include "vector_match_engine.hpp"

namespace artscan::recognition {

VectorMatchEngine::VectorMatchEngine(std::shared_ptr<db::Repository> repository, config::RecognitionSettings settings)
    : repository_(std::move(repository)), settings_(settings) {
}

model::MatchTier VectorMatchEngine::TierOf(const db::model::ArtworkRecord& artwork) {
  return artwork.is_verified ? artscan::v1::MATCH_TIER_VERIFIED : artscan::v1::MATCH_TIER_COMMUNITY;
}

std::optional<MatchResult> VectorMatchEngine::Match(const std::vector<float>& embedding, const std::vector<int64_t>& scope) const {
  auto tx     = repository_->Begin();
  auto result = Match(*tx, embedding, scope);
  tx->Commit();
  return result;
}

std::optional<MatchResult> VectorMatchEngine::Match(db::Transaction& tx, const std::vector<float>& embedding,
                                                    const std::vector<int64_t>& scope) const {
  const auto candidates = repository_->NearestArtworks(tx, embedding, scope, settings_.candidate_limit);
  if (candidates.empty()) {
    return std::nullopt;
  }

  // candidates arrive ranked; only the best one can qualify
  const auto& best = candidates.front();
  if (!(best.distance < settings_.distance_threshold)) {
    return std::nullopt;
  }

  return MatchResult{TierOf(best.artwork), best.artwork, best.distance};
}

} // namespace artscan::recognition
