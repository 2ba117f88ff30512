#pragma once

#include <optional>
#include <string_view>

#include "artscan/v1.hpp"

namespace artscan::model {

using artscan::v1::ArtworkSource;
using artscan::v1::IssueKind;
using artscan::v1::IssueState;
using artscan::v1::MatchTier;
using artscan::v1::ResolveOutcome;
using artscan::v1::ScanStatus;

// museum_api and admin are the only sources allowed to carry is_verified.
constexpr bool IsVerifiedSource(ArtworkSource source) {
  return source == artscan::v1::ARTWORK_SOURCE_MUSEUM_API || source == artscan::v1::ARTWORK_SOURCE_ADMIN;
}

constexpr std::string_view ToString(ArtworkSource source) {
  switch (source) {
    case artscan::v1::ARTWORK_SOURCE_MUSEUM_API:
      return "museum_api";
    case artscan::v1::ARTWORK_SOURCE_AI_GENERATED:
      return "ai_generated";
    case artscan::v1::ARTWORK_SOURCE_ADMIN:
      return "admin";
    case artscan::v1::ARTWORK_SOURCE_COMMUNITY:
      return "community";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(ScanStatus status) {
  switch (status) {
    case artscan::v1::SCAN_STATUS_MATCH_FOUND:
      return "match_found";
    case artscan::v1::SCAN_STATUS_VERIFIED_RESULT:
      return "verified_result";
    case artscan::v1::SCAN_STATUS_COMMUNITY_RESULT:
      return "community_result";
    case artscan::v1::SCAN_STATUS_AI_ANALYSIS:
      return "ai_analysis";
    case artscan::v1::SCAN_STATUS_NOT_ART:
      return "not_art";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(IssueKind kind) {
  switch (kind) {
    case artscan::v1::ISSUE_KIND_WRONG_TITLE:
      return "wrong_title";
    case artscan::v1::ISSUE_KIND_WRONG_ARTIST:
      return "wrong_artist";
    case artscan::v1::ISSUE_KIND_NOT_ARTWORK:
      return "not_artwork";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(IssueState state) {
  switch (state) {
    case artscan::v1::ISSUE_STATE_OPEN:
      return "open";
    case artscan::v1::ISSUE_STATE_RESOLVED:
      return "resolved";
    case artscan::v1::ISSUE_STATE_DISMISSED:
      return "dismissed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(MatchTier tier) {
  switch (tier) {
    case artscan::v1::MATCH_TIER_VERIFIED:
      return "verified";
    case artscan::v1::MATCH_TIER_COMMUNITY:
      return "community";
    case artscan::v1::MATCH_TIER_AI_GENERATED:
      return "ai_generated";
    default:
      return "unspecified";
  }
}

std::optional<ArtworkSource>  ParseArtworkSource(std::string_view value);
std::optional<ScanStatus>     ParseScanStatus(std::string_view value);
std::optional<IssueKind>      ParseIssueKind(std::string_view value);
std::optional<IssueState>     ParseIssueState(std::string_view value);
std::optional<ResolveOutcome> ParseResolveOutcome(std::string_view value);

} // namespace artscan::model
