#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace artscan::catalog {

/*
  Coarse locality-sensitive fingerprint of an embedding.

  Each bit is the sign of the projection onto a fixed pseudo-random
  hyperplane, so nearby embeddings usually share a bucket. The planes are
  derived from a constant seed and are identical across processes.
*/
class Fingerprinter {
 public:
  static constexpr std::size_t   kDefaultBits = 16;
  static constexpr std::uint64_t kSeed        = 0x61727473636e3031ULL;

  explicit Fingerprinter(std::size_t dimension, std::size_t bits = kDefaultBits);

  // Throws std::invalid_argument on a dimension mismatch.
  std::uint64_t Bucket(const std::vector<float>& embedding) const;

  std::size_t Dimension() const {
    return dimension_;
  }

 private:
  std::size_t                     dimension_;
  std::vector<std::vector<float>> planes_;
};

/*
  Fixed array of mutexes striped by fingerprint bucket.

  Two subjects may share a stripe; that only costs throughput.
*/
class FingerprintLockTable {
 public:
  static constexpr std::size_t kStripeCount = 64;

  std::mutex& For(std::uint64_t bucket) {
    return stripes_[bucket % kStripeCount];
  }

 private:
  std::array<std::mutex, kStripeCount> stripes_;
};

} // namespace artscan::catalog
