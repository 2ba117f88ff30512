#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/enums.hpp"

namespace artscan::db::model {

using artscan::model::ArtworkSource;
using artscan::model::IssueKind;
using artscan::model::IssueState;
using artscan::model::ScanStatus;

/*
  Persistent artwork row.

  IMPORTANT:
  - embedding dimension is constant across all rows.
  - is_verified implies source museum_api or admin.
  - description_json is a JSON object (style, year, narrative, ...).
*/
struct ArtworkRecord {
  int64_t                id = 0;
  std::optional<int64_t> museum_id;  // null: unaffiliated/community piece

  std::string title;
  std::string artist;
  std::string description_json = "{}";
  std::string image_url;

  std::vector<float> embedding;

  bool                  is_verified = false;
  ArtworkSource         source      = artscan::v1::ARTWORK_SOURCE_AI_GENERATED;
  std::optional<double> confidence_score;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

struct ArtworkCandidate {
  ArtworkRecord artwork;
  double        distance = 0.0;
};

// Shared write-time validation; backends call this before touching storage.
Result ValidateArtwork(const ArtworkRecord& record, std::size_t embedding_dimension);

// Ranking order of nearest-neighbour candidates: smaller distance first,
// verified sources before the others on exact ties, then lower id.
bool RanksBefore(const ArtworkCandidate& lhs, const ArtworkCandidate& rhs);

} // namespace artscan::db::model
