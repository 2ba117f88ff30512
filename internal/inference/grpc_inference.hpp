#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "artscan/inference/v1/inference.grpc.pb.h"
#include "internal/inference/inference.hpp"

namespace artscan::inference {

class GrpcEmbeddingModel final : public EmbeddingModel {
 public:
  GrpcEmbeddingModel(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  std::vector<float> Embed(const ImageInput& image) override;

 private:
  std::unique_ptr<artscan::inference::v1::EmbeddingModel::Stub> stub_;
  std::chrono::milliseconds                                    deadline_;
};

class GrpcVisionAnalyzer final : public VisionAnalyzer {
 public:
  GrpcVisionAnalyzer(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  AnalyzerReply Analyze(const ImageInput& image) override;

 private:
  std::unique_ptr<artscan::inference::v1::VisionAnalyzer::Stub> stub_;
  std::chrono::milliseconds                                    deadline_;
};

// Transport codes worth one more attempt.
bool IsTransient(const ::grpc::Status& status);

} // namespace artscan::inference
