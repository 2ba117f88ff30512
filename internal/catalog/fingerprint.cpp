#include "fingerprint.hpp"

#include <random>
#include <stdexcept>
#include <string>

namespace artscan::catalog {

Fingerprinter::Fingerprinter(std::size_t dimension, std::size_t bits) : dimension_(dimension) {
  if (bits == 0 || bits > 64) {
    throw std::invalid_argument("fingerprint bits must be in [1,64]");
  }

  std::mt19937_64                       rng(kSeed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

  planes_.resize(bits);
  for (auto& plane : planes_) {
    plane.resize(dimension_);
    for (auto& v : plane) {
      v = dist(rng);
    }
  }
}

std::uint64_t Fingerprinter::Bucket(const std::vector<float>& embedding) const {
  if (embedding.size() != dimension_) {
    throw std::invalid_argument("fingerprint expects dimension " + std::to_string(dimension_) + ", got " +
                                std::to_string(embedding.size()));
  }

  std::uint64_t bucket = 0;
  for (std::size_t bit = 0; bit < planes_.size(); ++bit) {
    double dot = 0.0;
    for (std::size_t i = 0; i < dimension_; ++i) {
      dot += static_cast<double>(planes_[bit][i]) * embedding[i];
    }
    if (dot >= 0.0) bucket |= (std::uint64_t{1} << bit);
  }
  return bucket;
}

} // namespace artscan::catalog
