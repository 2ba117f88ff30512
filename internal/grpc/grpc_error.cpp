#include "grpc_error.hpp"

namespace artscan::grpc {

bool IsRetryable(const std::exception& e) {
  using namespace artscan::util;
  return dynamic_cast<const EmbeddingUnavailable*>(&e) || dynamic_cast<const AnalysisUnavailable*>(&e) ||
         dynamic_cast<const StoreBusy*>(&e);
}

::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx) {
  using namespace artscan::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (IsRetryable(e)) {
    if (ctx) {
      ctx->AddTrailingMetadata(kRetryableTrailer, "true");
    }
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }
  if (dynamic_cast<const StoreConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace artscan::grpc
