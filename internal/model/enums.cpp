#include "enums.hpp"

namespace artscan::model {

std::optional<ArtworkSource> ParseArtworkSource(std::string_view value) {
  for (auto source : {artscan::v1::ARTWORK_SOURCE_MUSEUM_API, artscan::v1::ARTWORK_SOURCE_AI_GENERATED, artscan::v1::ARTWORK_SOURCE_ADMIN,
                      artscan::v1::ARTWORK_SOURCE_COMMUNITY}) {
    if (ToString(source) == value) return source;
  }
  return std::nullopt;
}

std::optional<ScanStatus> ParseScanStatus(std::string_view value) {
  for (auto status : {artscan::v1::SCAN_STATUS_MATCH_FOUND, artscan::v1::SCAN_STATUS_VERIFIED_RESULT, artscan::v1::SCAN_STATUS_COMMUNITY_RESULT,
                      artscan::v1::SCAN_STATUS_AI_ANALYSIS, artscan::v1::SCAN_STATUS_NOT_ART}) {
    if (ToString(status) == value) return status;
  }
  return std::nullopt;
}

std::optional<IssueKind> ParseIssueKind(std::string_view value) {
  for (auto kind : {artscan::v1::ISSUE_KIND_WRONG_TITLE, artscan::v1::ISSUE_KIND_WRONG_ARTIST, artscan::v1::ISSUE_KIND_NOT_ARTWORK}) {
    if (ToString(kind) == value) return kind;
  }
  return std::nullopt;
}

std::optional<IssueState> ParseIssueState(std::string_view value) {
  for (auto state : {artscan::v1::ISSUE_STATE_OPEN, artscan::v1::ISSUE_STATE_RESOLVED, artscan::v1::ISSUE_STATE_DISMISSED}) {
    if (ToString(state) == value) return state;
  }
  return std::nullopt;
}

std::optional<ResolveOutcome> ParseResolveOutcome(std::string_view value) {
  if (value == "dismiss") return artscan::v1::RESOLVE_OUTCOME_DISMISS;
  if (value == "apply_correction") return artscan::v1::RESOLVE_OUTCOME_APPLY_CORRECTION;
  if (value == "delete_artwork") return artscan::v1::RESOLVE_OUTCOME_DELETE_ARTWORK;
  if (value == "verify") return artscan::v1::RESOLVE_OUTCOME_VERIFY;
  return std::nullopt;
}

} // namespace artscan::model
