#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artscan::recognition {

inline constexpr double kEarthRadiusMeters = 6371000.0;

// Great-circle distance between two WGS84 points in degrees.
double HaversineMeters(double lat1, double lon1, double lat2, double lon2);

bool IsValidCoordinate(double latitude, double longitude);

/*
  GeofenceValidator

  Returns the ids (ascending) of every museum whose geofence contains the
  point. An empty scope is a normal outcome: invalid coordinates and
  museum lookup failures both produce it.
*/
class GeofenceValidator {
 public:
  explicit GeofenceValidator(std::shared_ptr<db::Repository> repository);

  std::vector<int64_t> CandidateMuseums(double latitude, double longitude) const;

 private:
  // Throws util::GeofenceLookupFailed.
  std::vector<db::model::MuseumRecord> LoadMuseums() const;

  std::shared_ptr<db::Repository> repository_;
};

} // namespace artscan::recognition
