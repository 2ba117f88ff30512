#include "recognition_settings.hpp"

namespace artscan::config {

RecognitionSettings ResolveRecognitionSettings(const artscan::runtime::config::RuntimeConfig& config) {
  const auto&         recognition = config.recognition();
  RecognitionSettings settings;

  if (recognition.distance_threshold() > 0.0) {
    settings.distance_threshold = recognition.distance_threshold();
  }
  if (recognition.embedding_dimension() > 0) {
    settings.embedding_dimension = recognition.embedding_dimension();
  }
  if (recognition.candidate_limit() > 0) {
    settings.candidate_limit = recognition.candidate_limit();
  }
  if (recognition.max_catalog_attempts() > 0) {
    settings.max_catalog_attempts = recognition.max_catalog_attempts();
  }
  if (recognition.max_image_bytes() > 0) {
    settings.max_image_bytes = recognition.max_image_bytes();
  }
  settings.legacy_match_status = recognition.legacy_match_status();

  return settings;
}

} // namespace artscan::config
