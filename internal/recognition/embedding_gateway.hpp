#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "internal/inference/inference.hpp"

namespace artscan::recognition {

/*
  EmbeddingGateway

  Adapter in front of the external embedding model.

  - one bounded retry, after retry_backoff, on a transient transport error
  - output has exactly `dimension` components, L2-normalized
  - a wrong dimension or an all-zero vector is EmbeddingUnavailable
  - no caching
*/
class EmbeddingGateway {
 public:
  EmbeddingGateway(std::shared_ptr<inference::EmbeddingModel> model, std::size_t dimension,
                   std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(100));

  std::vector<float> Embed(const inference::ImageInput& image) const;

  std::size_t Dimension() const {
    return dimension_;
  }

 private:
  std::vector<float> CallModel(const inference::ImageInput& image) const;

  std::shared_ptr<inference::EmbeddingModel> model_;
  std::size_t                                dimension_;
  std::chrono::milliseconds                  retry_backoff_;
};

} // namespace artscan::recognition
