#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace artscan::grpc {

inline constexpr const char* kRetryableTrailer = "retryable";

/*
  Converts internal exceptions into gRPC status codes.

  When a server context is given, failures of the external inference
  services and exhausted store retries also carry a "retryable: true"
  trailer.
*/

::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx = nullptr);

// Outages and store contention the caller may retry.
bool IsRetryable(const std::exception& e);

} // namespace artscan::grpc
