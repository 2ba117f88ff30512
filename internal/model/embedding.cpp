#include "embedding.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace artscan::model {

double L2Norm(const Embedding& v) {
  double sum = 0.0;
  for (float x : v) {
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  return std::sqrt(sum);
}

double CosineDistance(const Embedding& a, const Embedding& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("embedding dimension mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));
  }

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a <= 0.0 || norm_b <= 0.0) {
    return 1.0;
  }

  double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
  // rounding can push identical vectors slightly past 1
  if (similarity > 1.0) similarity = 1.0;
  if (similarity < -1.0) similarity = -1.0;
  return 1.0 - similarity;
}

bool Normalize(Embedding& v) {
  const double norm = L2Norm(v);
  if (!(norm > 0.0) || !std::isfinite(norm)) {
    return false;
  }
  for (auto& x : v) {
    x = static_cast<float>(x / norm);
  }
  return true;
}

} // namespace artscan::model
