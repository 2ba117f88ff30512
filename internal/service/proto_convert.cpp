#include "proto_convert.hpp"

#include "internal/model/description.hpp"
#include "internal/recognition/vector_match_engine.hpp"
#include "internal/util/time.hpp"

namespace artscan::service {

artscan::v1::Museum ToProto(const db::model::MuseumRecord& record) {
  artscan::v1::Museum museum;
  museum.set_id(record.id);
  museum.set_name(record.name);
  museum.mutable_location()->set_latitude(record.latitude);
  museum.mutable_location()->set_longitude(record.longitude);
  museum.set_geofence_radius_meters(record.geofence_radius_meters);
  return museum;
}

artscan::v1::Artwork ToProto(const db::model::ArtworkRecord& record) {
  artscan::v1::Artwork artwork;
  artwork.set_id(record.id);
  if (record.museum_id) {
    artwork.set_museum_id(*record.museum_id);
  }
  artwork.set_title(record.title);
  artwork.set_artist(record.artist);
  *artwork.mutable_description() = artscan::model::JsonToStruct(record.description_json);
  artwork.set_image_url(record.image_url);
  artwork.set_is_verified(record.is_verified);
  artwork.set_source(record.source);
  if (record.confidence_score) {
    artwork.set_confidence_score(*record.confidence_score);
  }
  artwork.set_tier(recognition::VectorMatchEngine::TierOf(record));
  return artwork;
}

artscan::v1::ScanEvent ToProto(const db::model::ScanRecord& record) {
  artscan::v1::ScanEvent event;
  event.set_id(record.id);
  event.set_user_id(record.user_id);
  if (record.artwork_id) {
    event.set_artwork_id(*record.artwork_id);
  }
  event.set_image_url(record.image_url);
  event.set_status(record.status);
  *event.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  return event;
}

artscan::v1::IssueReport ToProto(const db::model::IssueRecord& record) {
  artscan::v1::IssueReport report;
  report.set_id(record.id);
  report.set_artwork_id(record.artwork_id);
  report.set_user_id(record.user_id);
  report.set_kind(record.kind);
  report.set_note(record.note);
  report.set_state(record.state);
  *report.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  if (record.resolved_at_ms != 0) {
    *report.mutable_resolved_at() = util::MillisToProto(record.resolved_at_ms);
  }
  return report;
}

artscan::v1::Analysis ToProto(const recognition::Analysis& analysis) {
  artscan::v1::Analysis out;
  out.set_label(analysis.label);
  out.set_artist(analysis.artist);
  out.set_description(analysis.text);
  out.set_is_artwork(analysis.is_artwork);
  out.set_confidence(analysis.confidence);
  for (const auto& [key, value] : analysis.description) {
    (*out.mutable_attributes())[key] = value;
  }
  return out;
}

} // namespace artscan::service
