#include "artwork_record.hpp"

#include <cmath>

namespace artscan::db::model {

Result ValidateArtwork(const ArtworkRecord& record, std::size_t embedding_dimension) {
  if (record.title.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "artwork title is required");
  }

  if (embedding_dimension > 0 && record.embedding.size() != embedding_dimension) {
    return Result::Err(ErrorCode::ConstraintViolation, "artwork embedding has dimension " + std::to_string(record.embedding.size()) +
                                                           ", expected " + std::to_string(embedding_dimension));
  }
  for (float component : record.embedding) {
    if (!std::isfinite(component)) {
      return Result::Err(ErrorCode::ConstraintViolation, "artwork embedding has a non-finite component");
    }
  }

  if (record.confidence_score) {
    const double score = *record.confidence_score;
    if (!(score >= 0.0 && score <= 1.0)) {
      return Result::Err(ErrorCode::ConstraintViolation, "confidence_score must lie in [0,1]");
    }
  }

  switch (record.source) {
    case artscan::v1::ARTWORK_SOURCE_MUSEUM_API:
    case artscan::v1::ARTWORK_SOURCE_AI_GENERATED:
    case artscan::v1::ARTWORK_SOURCE_ADMIN:
    case artscan::v1::ARTWORK_SOURCE_COMMUNITY:
      break;
    default:
      return Result::Err(ErrorCode::ConstraintViolation, "artwork source is unspecified");
  }

  if (record.is_verified && !artscan::model::IsVerifiedSource(record.source)) {
    return Result::Err(ErrorCode::ConstraintViolation, "only museum_api or admin artworks can be verified");
  }

  return Result::Ok();
}

bool RanksBefore(const ArtworkCandidate& lhs, const ArtworkCandidate& rhs) {
  if (lhs.distance != rhs.distance) {
    return lhs.distance < rhs.distance;
  }

  const bool lhs_verified = artscan::model::IsVerifiedSource(lhs.artwork.source);
  const bool rhs_verified = artscan::model::IsVerifiedSource(rhs.artwork.source);
  if (lhs_verified != rhs_verified) {
    return lhs_verified;
  }

  return lhs.artwork.id < rhs.artwork.id;
}

} // namespace artscan::db::model
