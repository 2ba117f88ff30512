#include "issue_tracker.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/model/description.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace artscan::ledger {

using artscan::observability::IntField;
using artscan::observability::StringField;

IssueTracker::IssueTracker(std::shared_ptr<db::Repository> repository, MillisClock clock)
    : repository_(std::move(repository)), clock_(clock ? std::move(clock) : MillisClock(&util::NowMillis)) {
}

db::model::ArtworkRecord IssueTracker::LoadArtwork(db::Transaction& tx, int64_t artwork_id) const {
  auto artwork = repository_->GetArtwork(tx, artwork_id);
  if (!artwork) {
    throw util::ArtworkNotFound("artwork " + std::to_string(artwork_id) + " not found");
  }
  return *artwork;
}

db::model::IssueRecord IssueTracker::ReportIssue(int64_t artwork_id, const std::string& user_id, model::IssueKind kind,
                                                 const std::string& note) {
  if (kind == artscan::v1::ISSUE_KIND_UNSPECIFIED) {
    throw util::InvalidArgument("issue kind is required");
  }
  if (user_id.empty()) {
    throw util::InvalidArgument("issue user_id is required");
  }

  auto tx = repository_->Begin();
  LoadArtwork(*tx, artwork_id);

  db::model::IssueRecord report;
  report.artwork_id    = artwork_id;
  report.user_id       = user_id;
  report.kind          = kind;
  report.note          = note;
  report.state         = artscan::v1::ISSUE_STATE_OPEN;
  report.created_at_ms = clock_();
  db::ThrowIfDbError(repository_->InsertIssue(*tx, report), "insert issue report");
  tx->Commit();

  ARTSCAN_LOG_INFO("issue reported", {IntField("report_id", report.id), IntField("artwork_id", artwork_id),
                                      StringField("kind", model::ToString(kind))});
  return report;
}

ResolveResult IssueTracker::ResolveIssue(int64_t report_id, model::ResolveOutcome outcome, const ArtworkCorrection& correction) {
  auto tx     = repository_->Begin();
  auto report = repository_->GetIssue(*tx, report_id);
  if (!report) {
    throw util::NotFound("issue report " + std::to_string(report_id) + " not found");
  }
  if (report->state != artscan::v1::ISSUE_STATE_OPEN) {
    throw util::InvalidState("issue report " + std::to_string(report_id) + " is already " + std::string(model::ToString(report->state)));
  }

  ResolveResult result;
  switch (outcome) {
    case artscan::v1::RESOLVE_OUTCOME_DISMISS:
      report->state = artscan::v1::ISSUE_STATE_DISMISSED;
      break;

    case artscan::v1::RESOLVE_OUTCOME_APPLY_CORRECTION: {
      if (correction.Empty()) {
        throw util::InvalidArgument("apply_correction needs at least one corrected field");
      }
      auto artwork = LoadArtwork(*tx, report->artwork_id);
      if (correction.title) artwork.title = *correction.title;
      if (correction.artist) artwork.artist = *correction.artist;
      if (correction.description) artwork.description_json = model::MergeDescriptionJson(artwork.description_json, *correction.description);
      db::ThrowIfDbError(repository_->UpdateArtwork(*tx, artwork), "apply correction");
      result.artwork = std::move(artwork);
      report->state  = artscan::v1::ISSUE_STATE_RESOLVED;
      break;
    }

    case artscan::v1::RESOLVE_OUTCOME_DELETE_ARTWORK: {
      auto deleted = repository_->DeleteArtwork(*tx, report->artwork_id);
      if (deleted.code == db::ErrorCode::NotFound) {
        throw util::ArtworkNotFound("artwork " + std::to_string(report->artwork_id) + " not found");
      }
      db::ThrowIfDbError(deleted, "delete artwork");
      result.artwork_deleted = true;
      report->state          = artscan::v1::ISSUE_STATE_RESOLVED;
      break;
    }

    case artscan::v1::RESOLVE_OUTCOME_VERIFY: {
      auto artwork        = LoadArtwork(*tx, report->artwork_id);
      artwork.is_verified = true;
      artwork.source      = artscan::v1::ARTWORK_SOURCE_ADMIN;
      db::ThrowIfDbError(repository_->UpdateArtwork(*tx, artwork), "verify artwork");
      result.artwork = std::move(artwork);
      report->state  = artscan::v1::ISSUE_STATE_RESOLVED;
      break;
    }

    default:
      throw util::InvalidArgument("resolve outcome is required");
  }

  report->resolved_at_ms = clock_();
  db::ThrowIfDbError(repository_->UpdateIssue(*tx, *report), "update issue report");
  tx->Commit();

  ARTSCAN_LOG_INFO("issue resolved", {IntField("report_id", report_id), StringField("state", model::ToString(report->state)),
                                      IntField("artwork_id", report->artwork_id)});
  result.report = *report;
  return result;
}

std::vector<db::model::IssueRecord> IssueTracker::ListIssues(std::optional<model::IssueState> state, const db::Pagination& pagination) const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListIssues(*tx, state, pagination);
  tx->Commit();
  return rows;
}

} // namespace artscan::ledger
