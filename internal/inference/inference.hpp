#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace artscan::inference {

struct ImageInput {
  std::string bytes;
  std::string content_type;
};

/*
  Raw reply of the vision-language model, before classification.

  is_artwork is empty when the model answered in free text only.
*/
struct AnalyzerReply {
  std::string                        text;
  std::optional<bool>                is_artwork;
  std::string                        label;
  std::string                        artist;
  double                             confidence = 0.0;
  std::map<std::string, std::string> attributes;
};

/*
  Capability interfaces for the external models.

  Implementations throw util::TransientError for transport failures that
  may succeed on retry and the component-specific *Unavailable error for
  everything else.
*/
class EmbeddingModel {
 public:
  virtual ~EmbeddingModel() = default;

  virtual std::vector<float> Embed(const ImageInput& image) = 0;
};

class VisionAnalyzer {
 public:
  virtual ~VisionAnalyzer() = default;

  virtual AnalyzerReply Analyze(const ImageInput& image) = 0;
};

} // namespace artscan::inference
