#include "fallback_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace artscan::recognition {

FallbackDispatcher::FallbackDispatcher(std::shared_ptr<inference::VisionAnalyzer> analyzer) : analyzer_(std::move(analyzer)) {
  if (!analyzer_) {
    throw std::invalid_argument("FallbackDispatcher requires a vision analyzer");
  }
}

bool FallbackDispatcher::TextSaysNotArt(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("not an artwork") != std::string::npos || lower.find("not artwork") != std::string::npos;
}

Analysis FallbackDispatcher::Analyze(const inference::ImageInput& image) const {
  inference::AnalyzerReply reply;
  try {
    reply = analyzer_->Analyze(image);
  } catch (const util::TransientError& e) {
    throw util::AnalysisUnavailable(e.what());
  }

  Analysis analysis;
  analysis.text       = reply.text;
  analysis.is_artwork = reply.is_artwork.has_value() ? *reply.is_artwork : !TextSaysNotArt(reply.text);
  if (!analysis.is_artwork) {
    return analysis;
  }

  analysis.label       = reply.label.empty() ? kDefaultLabel : reply.label;
  analysis.artist      = reply.artist;
  analysis.description = reply.attributes;
  if (!analysis.text.empty()) {
    analysis.description.emplace("narrative", analysis.text);
  }
  analysis.confidence = std::isfinite(reply.confidence) ? std::clamp(reply.confidence, 0.0, 1.0) : 0.0;
  return analysis;
}

} // namespace artscan::recognition
