#include "embedding_gateway.hpp"

#include <stdexcept>
#include <string>
#include <thread>

#include "internal/model/embedding.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artscan::recognition {

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<inference::EmbeddingModel> model, std::size_t dimension,
                                   std::chrono::milliseconds retry_backoff)
    : model_(std::move(model)), dimension_(dimension), retry_backoff_(retry_backoff) {
  if (!model_) {
    throw std::invalid_argument("EmbeddingGateway requires an embedding model");
  }
}

std::vector<float> EmbeddingGateway::CallModel(const inference::ImageInput& image) const {
  try {
    return model_->Embed(image);
  } catch (const util::TransientError& e) {
    ARTSCAN_LOG_WARN("embedding call failed, retrying once",
                     {observability::StringField("error", e.what()), observability::IntField("backoff_ms", retry_backoff_.count())});
  }

  if (retry_backoff_.count() > 0) {
    std::this_thread::sleep_for(retry_backoff_);
  }

  try {
    return model_->Embed(image);
  } catch (const util::TransientError& e) {
    throw util::EmbeddingUnavailable(std::string("embedding model unavailable after retry: ") + e.what());
  }
}

std::vector<float> EmbeddingGateway::Embed(const inference::ImageInput& image) const {
  auto embedding = CallModel(image);

  if (embedding.size() != dimension_) {
    throw util::EmbeddingUnavailable("embedding model returned dimension " + std::to_string(embedding.size()) + ", expected " +
                                     std::to_string(dimension_));
  }
  if (!model::Normalize(embedding)) {
    throw util::EmbeddingUnavailable("embedding model returned a zero or non-finite vector");
  }

  return embedding;
}

} // namespace artscan::recognition
