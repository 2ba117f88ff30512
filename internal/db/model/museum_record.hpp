#pragma once

#include <cstdint>
#include <string>

namespace artscan::db::model {

struct MuseumRecord {
  int64_t     id = 0;
  std::string name;

  // degrees, WGS84
  double latitude  = 0.0;
  double longitude = 0.0;

  double geofence_radius_meters = 100.0;
};

} // namespace artscan::db::model
