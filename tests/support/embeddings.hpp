#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace artscan::testing {

// Unit vector with cosine distance `distance` from the base axis e0,
// rotated towards e_axis.
inline std::vector<float> AtDistance(std::size_t dimension, double distance, std::size_t axis = 1) {
  std::vector<float> v(dimension, 0.0f);
  const double       c = 1.0 - distance;
  v[0]                 = static_cast<float>(c);
  v[axis]              = static_cast<float>(std::sqrt(std::max(0.0, 1.0 - c * c)));
  return v;
}

inline std::vector<float> Axis(std::size_t dimension, std::size_t axis) {
  std::vector<float> v(dimension, 0.0f);
  v[axis] = 1.0f;
  return v;
}

} // namespace artscan::testing
