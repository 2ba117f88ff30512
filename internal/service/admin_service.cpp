#include "admin_service.hpp"

#include <cmath>

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/issue_tracker.hpp"
#include "internal/ledger/scan_ledger.hpp"
#include "internal/model/description.hpp"
#include "internal/model/embedding.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recognition/embedding_gateway.hpp"
#include "internal/recognition/geofence_validator.hpp"
#include "internal/storage/image_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/image_format.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace artscan::service {

using namespace artscan::v1;
using artscan::observability::IntField;
using artscan::observability::StringField;

namespace {

db::Pagination ToPagination(uint32_t limit, uint32_t offset) {
  return db::Pagination{limit == 0 ? AdminService::kDefaultPageSize : limit, offset};
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateMuseumResponse AdminService::CreateMuseum(const CreateMuseumRequest& req) {
  return ObserveRpc("AdminService.CreateMuseum", [&](observability::SpanScope&) {
    if (req.name().empty()) {
      throw util::InvalidArgument("create museum: name is required");
    }
    if (!recognition::IsValidCoordinate(req.location().latitude(), req.location().longitude())) {
      throw util::InvalidArgument("create museum: location is not a valid WGS84 coordinate");
    }

    db::model::MuseumRecord record;
    record.name      = req.name();
    record.latitude  = req.location().latitude();
    record.longitude = req.location().longitude();
    if (!std::isfinite(req.geofence_radius_meters()) || req.geofence_radius_meters() < 0.0) {
      throw util::InvalidArgument("create museum: geofence_radius_meters must be positive");
    }
    if (req.geofence_radius_meters() > 0.0) {
      record.geofence_radius_meters = req.geofence_radius_meters();
    }

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertMuseum(*tx, record), "create museum");
    tx->Commit();

    ARTSCAN_LOG_INFO("museum created", {IntField("museum_id", record.id), StringField("name", record.name)});

    CreateMuseumResponse resp;
    *resp.mutable_museum() = ToProto(record);
    return resp;
  });
}

ListMuseumsResponse AdminService::ListMuseums(const ListMuseumsRequest&) {
  return ObserveRpc("AdminService.ListMuseums", [&](observability::SpanScope&) {
    auto tx      = ctx_.repository->Begin();
    auto museums = ctx_.repository->ListMuseums(*tx);
    tx->Commit();

    ListMuseumsResponse resp;
    for (const auto& museum : museums) {
      *resp.add_museums() = ToProto(museum);
    }
    return resp;
  });
}

std::vector<float> AdminService::ResolveEmbedding(const CreateArtworkRequest& req, std::string& image_url) {
  std::optional<util::ImageFormat> format;
  if (!req.image().empty()) {
    if (req.image().size() > ctx_.settings.max_image_bytes) {
      throw util::InvalidImage("artwork image exceeds " + std::to_string(ctx_.settings.max_image_bytes) + " bytes");
    }
    format = util::DetectImageFormat(req.image());
    if (!format) {
      throw util::InvalidImage("artwork image is not a JPEG, PNG, GIF, WebP or BMP file");
    }
    image_url = ctx_.images->Put(req.image(), *format);
  }

  if (req.embedding_size() > 0) {
    std::vector<float> embedding(req.embedding().begin(), req.embedding().end());
    if (embedding.size() != ctx_.gateway->Dimension()) {
      throw util::InvalidArgument("create artwork: embedding has " + std::to_string(embedding.size()) + " components, expected " +
                                  std::to_string(ctx_.gateway->Dimension()));
    }
    if (!model::Normalize(embedding)) {
      throw util::InvalidArgument("create artwork: embedding is zero or not finite");
    }
    return embedding;
  }

  if (!format) {
    throw util::InvalidArgument("create artwork: either image bytes or an embedding is required");
  }
  return ctx_.gateway->Embed(inference::ImageInput{req.image(), format->content_type});
}

CreateArtworkResponse AdminService::CreateArtwork(const CreateArtworkRequest& req) {
  return ObserveRpc("AdminService.CreateArtwork", [&](observability::SpanScope& span) {
    if (req.title().empty()) {
      throw util::InvalidArgument("create artwork: title is required");
    }
    if (!model::IsVerifiedSource(req.source())) {
      throw util::InvalidArgument("create artwork: source must be admin or museum_api");
    }

    db::model::ArtworkRecord record;
    record.image_url = req.image_url();
    record.embedding = ResolveEmbedding(req, record.image_url);
    if (req.has_museum_id()) {
      record.museum_id = req.museum_id();
    }
    record.title            = req.title();
    record.artist           = req.artist();
    record.description_json = model::StructToJson(req.description());
    record.is_verified      = true;
    record.source           = req.source();

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertArtwork(*tx, record), "create artwork");
    tx->Commit();

    span.SetAttribute("artwork.id", static_cast<int64_t>(record.id));
    ARTSCAN_LOG_INFO("verified artwork created",
                     {IntField("artwork_id", record.id), StringField("title", record.title), StringField("source", model::ToString(record.source))});

    CreateArtworkResponse resp;
    *resp.mutable_artwork() = ToProto(record);
    return resp;
  });
}

GetArtworkResponse AdminService::GetArtwork(const GetArtworkRequest& req) {
  return ObserveRpc("AdminService.GetArtwork", [&](observability::SpanScope&) {
    auto tx      = ctx_.repository->Begin();
    auto artwork = ctx_.repository->GetArtwork(*tx, req.id());
    tx->Commit();
    if (!artwork) {
      throw util::ArtworkNotFound("artwork " + std::to_string(req.id()) + " not found");
    }

    GetArtworkResponse resp;
    *resp.mutable_artwork() = ToProto(*artwork);
    return resp;
  });
}

ListIssuesResponse AdminService::ListIssues(const ListIssuesRequest& req) {
  return ObserveRpc("AdminService.ListIssues", [&](observability::SpanScope&) {
    std::optional<model::IssueState> state;
    if (req.state() != ISSUE_STATE_UNSPECIFIED) {
      state = req.state();
    }

    ListIssuesResponse resp;
    for (const auto& report : ctx_.issues->ListIssues(state, ToPagination(req.limit(), req.offset()))) {
      *resp.add_reports() = ToProto(report);
    }
    return resp;
  });
}

ResolveIssueResponse AdminService::ResolveIssue(const ResolveIssueRequest& req) {
  return ObserveRpc("AdminService.ResolveIssue", [&](observability::SpanScope& span) {
    span.SetAttribute("issue.id", static_cast<int64_t>(req.report_id()));

    ledger::ArtworkCorrection correction;
    if (req.correction().has_title()) {
      correction.title = req.correction().title();
    }
    if (req.correction().has_artist()) {
      correction.artist = req.correction().artist();
    }
    if (req.correction().has_description() && req.correction().description().fields_size() > 0) {
      correction.description = req.correction().description();
    }

    const auto result = ctx_.issues->ResolveIssue(req.report_id(), req.outcome(), correction);

    ResolveIssueResponse resp;
    *resp.mutable_report() = ToProto(result.report);
    if (result.artwork) {
      *resp.mutable_artwork() = ToProto(*result.artwork);
    }
    resp.set_artwork_deleted(result.artwork_deleted);
    return resp;
  });
}

ListScansResponse AdminService::ListScans(const ListScansRequest& req) {
  return ObserveRpc("AdminService.ListScans", [&](observability::SpanScope&) {
    if (req.user_id().empty()) {
      throw util::InvalidArgument("list scans: user_id is required");
    }

    ListScansResponse resp;
    for (const auto& event : ctx_.ledger->List(req.user_id(), ToPagination(req.limit(), req.offset()))) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

} // namespace artscan::service
