#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/inference/inference.hpp"

namespace artscan::recognition {

struct Analysis {
  std::string                        label;
  std::string                        artist;
  std::map<std::string, std::string> description;
  std::string                        text;
  bool                               is_artwork = false;
  double                             confidence = 0.0;
};

/*
  FallbackDispatcher

  Calls the generative description service when nothing matched and
  classifies the reply. Failures are AnalysisUnavailable and are not
  retried.
*/
class FallbackDispatcher {
 public:
  static constexpr const char* kDefaultLabel = "Untitled";

  explicit FallbackDispatcher(std::shared_ptr<inference::VisionAnalyzer> analyzer);

  Analysis Analyze(const inference::ImageInput& image) const;

  // Free-text verdict used when the reply has no structured flag.
  static bool TextSaysNotArt(const std::string& text);

 private:
  std::shared_ptr<inference::VisionAnalyzer> analyzer_;
};

} // namespace artscan::recognition
