#include "geofence_validator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artscan::recognition {

namespace {

double Radians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

} // namespace

double HaversineMeters(double lat1, double lon1, double lat2, double lon2) {
  const double dlat = Radians(lat2 - lat1);
  const double dlon = Radians(lon2 - lon1);

  const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(Radians(lat1)) * std::cos(Radians(lat2)) * std::sin(dlon / 2) * std::sin(dlon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusMeters * c;
}

bool IsValidCoordinate(double latitude, double longitude) {
  return std::isfinite(latitude) && std::isfinite(longitude) && std::abs(latitude) <= 90.0 && std::abs(longitude) <= 180.0;
}

GeofenceValidator::GeofenceValidator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<db::model::MuseumRecord> GeofenceValidator::LoadMuseums() const {
  try {
    auto tx      = repository_->Begin();
    auto museums = repository_->ListMuseums(*tx);
    tx->Commit();
    return museums;
  } catch (const std::exception& e) {
    throw util::GeofenceLookupFailed(e.what());
  }
}

std::vector<int64_t> GeofenceValidator::CandidateMuseums(double latitude, double longitude) const {
  if (!IsValidCoordinate(latitude, longitude)) {
    ARTSCAN_LOG_DEBUG("invalid scan coordinates, using global scope",
                      {observability::DoubleField("latitude", latitude), observability::DoubleField("longitude", longitude)});
    return {};
  }

  std::vector<db::model::MuseumRecord> museums;
  try {
    museums = LoadMuseums();
  } catch (const util::GeofenceLookupFailed& e) {
    ARTSCAN_LOG_WARN("museum lookup failed, using global scope", {observability::StringField("error", e.what())});
    return {};
  }

  std::vector<int64_t> scope;
  for (const auto& museum : museums) {
    if (HaversineMeters(latitude, longitude, museum.latitude, museum.longitude) <= museum.geofence_radius_meters) {
      scope.push_back(museum.id);
    }
  }
  std::sort(scope.begin(), scope.end());
  return scope;
}

} // namespace artscan::recognition
