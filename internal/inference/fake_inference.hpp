#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/inference/inference.hpp"

namespace artscan::inference {

// Stable 64-bit FNV-1a, used to seed the deterministic fakes.
uint64_t Fingerprint64(std::string_view bytes);

/*
  Deterministic embedding model for local runs.

  Identical image bytes always map to the identical vector; different
  bytes map to near-orthogonal vectors.
*/
class FakeEmbeddingModel final : public EmbeddingModel {
 public:
  explicit FakeEmbeddingModel(std::size_t dimension);

  std::vector<float> Embed(const ImageInput& image) override;

 private:
  std::size_t dimension_;
};

// Classifies every image as an artwork with confidence 0.5.
class FakeVisionAnalyzer final : public VisionAnalyzer {
 public:
  AnalyzerReply Analyze(const ImageInput& image) override;
};

} // namespace artscan::inference
