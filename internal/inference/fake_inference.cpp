#include "fake_inference.hpp"

#include <cstdio>
#include <random>

namespace artscan::inference {

uint64_t Fingerprint64(std::string_view bytes) {
  uint64_t hash = 1469598103934665603ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

FakeEmbeddingModel::FakeEmbeddingModel(std::size_t dimension) : dimension_(dimension) {
}

std::vector<float> FakeEmbeddingModel::Embed(const ImageInput& image) {
  std::mt19937_64                       rng(Fingerprint64(image.bytes));
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

  std::vector<float> out(dimension_);
  for (auto& v : out) {
    v = dist(rng);
  }
  return out;
}

AnalyzerReply FakeVisionAnalyzer::Analyze(const ImageInput& image) {
  char tag[17];
  std::snprintf(tag, sizeof(tag), "%016llx", static_cast<unsigned long long>(Fingerprint64(image.bytes)));

  AnalyzerReply reply;
  reply.is_artwork            = true;
  reply.label                 = std::string("Unidentified work ") + std::string(tag, 8);
  reply.confidence            = 0.5;
  reply.text                  = "This appears to be an artwork. No catalog record could be matched, so the description is estimated.";
  reply.attributes["style"]   = "unknown";
  reply.attributes["medium"]  = "unknown";
  return reply;
}

} // namespace artscan::inference
