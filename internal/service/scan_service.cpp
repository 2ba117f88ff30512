#include "scan_service.hpp"

#include <string>

#include "internal/catalog/auto_catalog_coordinator.hpp"
#include "internal/ledger/issue_tracker.hpp"
#include "internal/ledger/scan_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recognition/embedding_gateway.hpp"
#include "internal/recognition/fallback_dispatcher.hpp"
#include "internal/recognition/geofence_validator.hpp"
#include "internal/recognition/vector_match_engine.hpp"
#include "internal/storage/image_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/image_format.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace artscan::service {

using namespace artscan::v1;
using artscan::observability::DoubleField;
using artscan::observability::IntField;
using artscan::observability::StringField;

namespace {

std::string ResolveUser(const std::string& user_id) {
  return user_id.empty() ? ScanService::kAnonymousUser : user_id;
}

ScanStatus MatchStatus(MatchTier tier, bool legacy) {
  if (legacy) {
    return SCAN_STATUS_MATCH_FOUND;
  }
  return tier == MATCH_TIER_VERIFIED ? SCAN_STATUS_VERIFIED_RESULT : SCAN_STATUS_COMMUNITY_RESULT;
}

} // namespace

ScanService::ScanService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitScanResponse ScanService::SubmitScan(const SubmitScanRequest& req, const util::CancellationToken& cancel) {
  return ObserveRpc("ScanService.SubmitScan", [&](observability::SpanScope& span) {
    const auto user_id = ResolveUser(req.user_id());
    span.SetAttribute("scan.user_id", user_id);

    auto resp = RunPipeline(req, user_id, cancel);
    span.SetAttribute("scan.status", std::string(model::ToString(resp.status())));
    observability::Metrics::Instance().RecordScanOutcome(model::ToString(resp.status()));
    return resp;
  });
}

SubmitScanResponse ScanService::RunPipeline(const SubmitScanRequest& req, const std::string& user_id, const util::CancellationToken& cancel) {
  const auto& bytes = req.image();
  if (bytes.empty()) {
    throw util::InvalidImage("scan image is empty");
  }
  if (bytes.size() > ctx_.settings.max_image_bytes) {
    throw util::InvalidImage("scan image exceeds " + std::to_string(ctx_.settings.max_image_bytes) + " bytes");
  }
  const auto format = util::DetectImageFormat(bytes);
  if (!format) {
    throw util::InvalidImage("scan image is not a JPEG, PNG, GIF, WebP or BMP file");
  }

  cancel.ThrowIfCancelled("image upload");
  const auto image_url = ctx_.images->Put(bytes, *format);

  cancel.ThrowIfCancelled("embedding");
  const inference::ImageInput image{bytes, format->content_type};
  const auto                  embedding = ctx_.gateway->Embed(image);

  cancel.ThrowIfCancelled("geofence lookup");
  const auto scope = ctx_.geofence->CandidateMuseums(req.latitude(), req.longitude());

  cancel.ThrowIfCancelled("match");
  const auto match = ctx_.match_engine->Match(embedding, scope);
  ARTSCAN_LOG_INFO("scan matched", {StringField("user_id", user_id), IntField("scope_size", static_cast<int64_t>(scope.size())),
                                    match ? DoubleField("distance", match->distance) : StringField("distance", "none")});

  SubmitScanResponse resp;
  if (match) {
    resp.set_status(MatchStatus(match->tier, ctx_.settings.legacy_match_status));
    *resp.mutable_artwork() = ToProto(match->artwork);
    resp.set_distance(match->distance);
    resp.set_cataloged(false);
    resp.set_scan_id(RecordScan(user_id, match->artwork.id, image_url, resp.status()));
    return resp;
  }

  cancel.ThrowIfCancelled("analysis");
  const auto analysis = ctx_.dispatcher->Analyze(image);
  *resp.mutable_analysis() = ToProto(analysis);

  if (!analysis.is_artwork) {
    resp.set_status(SCAN_STATUS_NOT_ART);
    resp.set_message(analysis.text.empty() ? "The image does not appear to show an artwork." : analysis.text);
    resp.set_cataloged(false);
    resp.set_scan_id(RecordScan(user_id, std::nullopt, image_url, SCAN_STATUS_NOT_ART));
    return resp;
  }

  // last cancellation point; the catalog insert runs to completion
  cancel.ThrowIfCancelled("catalog");

  catalog::CatalogRequest request;
  request.embedding   = embedding;
  request.title       = analysis.label;
  request.artist      = analysis.artist;
  request.description = analysis.description;
  request.confidence  = analysis.confidence;
  request.image_url   = image_url;
  request.scope       = scope;

  const auto outcome = ctx_.coordinator->GetOrCreate(request);
  observability::Metrics::Instance().RecordCatalogCreation(outcome.created);

  resp.set_status(outcome.created ? SCAN_STATUS_AI_ANALYSIS
                                  : MatchStatus(recognition::VectorMatchEngine::TierOf(outcome.artwork), ctx_.settings.legacy_match_status));
  resp.set_cataloged(outcome.created);
  resp.set_message(analysis.text);
  *resp.mutable_artwork() = ToProto(outcome.artwork);
  if (outcome.created) {
    resp.mutable_artwork()->set_tier(MATCH_TIER_AI_GENERATED);
  }
  resp.set_distance(outcome.distance);
  resp.set_scan_id(RecordScan(user_id, outcome.artwork.id, image_url, resp.status()));
  return resp;
}

int64_t ScanService::RecordScan(const std::string& user_id, std::optional<int64_t> artwork_id, const std::string& image_url, ScanStatus status) {
  try {
    return ctx_.ledger->Record(user_id, artwork_id, image_url, status).id;
  } catch (const std::exception& e) {
    ARTSCAN_LOG_WARN("failed to record scan event",
                     {StringField("user_id", user_id), StringField("status", model::ToString(status)), StringField("error", e.what())});
    return 0;
  }
}

ReportIssueResponse ScanService::ReportIssue(const ReportIssueRequest& req) {
  return ObserveRpc("ScanService.ReportIssue", [&](observability::SpanScope& span) {
    span.SetAttribute("artwork.id", static_cast<int64_t>(req.artwork_id()));
    const auto report = ctx_.issues->ReportIssue(req.artwork_id(), ResolveUser(req.user_id()), req.kind(), req.note());

    ReportIssueResponse resp;
    resp.set_accepted(true);
    *resp.mutable_report() = ToProto(report);
    return resp;
  });
}

} // namespace artscan::service
