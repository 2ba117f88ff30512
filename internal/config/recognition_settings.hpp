#pragma once

#include <cstddef>
#include <cstdint>

#include "config/config.pb.h"

namespace artscan::config {

/*
  Policy constants of the recognition pipeline.

  Exposed through RecognitionConfig; zero values in the config keep
  these defaults.
*/
struct RecognitionSettings {
  static constexpr double        kDefaultDistanceThreshold = 0.15;
  static constexpr std::size_t   kDefaultEmbeddingDimension = 512;
  static constexpr std::size_t   kDefaultCandidateLimit     = 8;
  static constexpr std::uint32_t kDefaultCatalogAttempts    = 3;
  static constexpr std::uint64_t kDefaultMaxImageBytes      = 10ull * 1024 * 1024;

  double        distance_threshold   = kDefaultDistanceThreshold;
  std::size_t   embedding_dimension  = kDefaultEmbeddingDimension;
  std::size_t   candidate_limit      = kDefaultCandidateLimit;
  bool          legacy_match_status  = false;
  std::uint32_t max_catalog_attempts = kDefaultCatalogAttempts;
  std::uint64_t max_image_bytes      = kDefaultMaxImageBytes;
};

RecognitionSettings ResolveRecognitionSettings(const artscan::runtime::config::RuntimeConfig& config);

} // namespace artscan::config
