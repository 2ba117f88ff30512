#include "grpc_inference.hpp"

#include <grpcpp/client_context.h>

#include "internal/util/errors.hpp"

namespace artscan::inference {

namespace {

constexpr const char* kAnalyzePrompt =
    "Identify this artwork. Reply with its title, artist, style, period and a short description. "
    "If the image does not show an artwork, say that it is not an artwork.";

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds deadline) {
  if (deadline.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + deadline);
  }
}

std::string Describe(const char* call, const ::grpc::Status& status) {
  return std::string(call) + " failed (code " + std::to_string(static_cast<int>(status.error_code())) + "): " + status.error_message();
}

} // namespace

bool IsTransient(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return true;
    default:
      return false;
  }
}

GrpcEmbeddingModel::GrpcEmbeddingModel(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(artscan::inference::v1::EmbeddingModel::NewStub(std::move(channel))), deadline_(deadline) {
}

std::vector<float> GrpcEmbeddingModel::Embed(const ImageInput& image) {
  artscan::inference::v1::EmbedRequest req;
  req.set_image(image.bytes);
  req.set_content_type(image.content_type);

  artscan::inference::v1::EmbedResponse resp;
  ::grpc::ClientContext                   ctx;
  SetDeadline(ctx, deadline_);

  const auto status = stub_->Embed(&ctx, req, &resp);
  if (!status.ok()) {
    if (IsTransient(status)) throw util::TransientError(Describe("Embed", status));
    throw util::EmbeddingUnavailable(Describe("Embed", status));
  }

  return {resp.embedding().begin(), resp.embedding().end()};
}

GrpcVisionAnalyzer::GrpcVisionAnalyzer(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(artscan::inference::v1::VisionAnalyzer::NewStub(std::move(channel))), deadline_(deadline) {
}

AnalyzerReply GrpcVisionAnalyzer::Analyze(const ImageInput& image) {
  artscan::inference::v1::AnalyzeRequest req;
  req.set_image(image.bytes);
  req.set_content_type(image.content_type);
  req.set_prompt(kAnalyzePrompt);

  artscan::inference::v1::AnalyzeResponse resp;
  ::grpc::ClientContext                     ctx;
  SetDeadline(ctx, deadline_);

  const auto status = stub_->Analyze(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::AnalysisUnavailable(Describe("Analyze", status));
  }

  AnalyzerReply reply;
  reply.text = resp.text();
  if (resp.has_is_artwork()) reply.is_artwork = resp.is_artwork();
  reply.label      = resp.label();
  reply.artist     = resp.artist();
  reply.confidence = resp.confidence();
  reply.attributes.insert(resp.attributes().begin(), resp.attributes().end());
  return reply;
}

} // namespace artscan::inference
