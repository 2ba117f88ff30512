#pragma once

#include <stdexcept>
#include <string>

namespace artscan::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtworkNotFound : public NotFound {
 public:
  explicit ArtworkNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed or undecodable image; rejected before embedding.
class InvalidImage : public InvalidArgument {
 public:
  explicit InvalidImage(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  External collaborators.

  Surfaced once to the caller with a retryable hint.
*/

class EmbeddingUnavailable : public std::runtime_error {
 public:
  explicit EmbeddingUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AnalysisUnavailable : public std::runtime_error {
 public:
  explicit AnalysisUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport-level failure of an inference call (deadline, connection reset).
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Never fatal: the scan continues with an empty museum scope.
class GeofenceLookupFailed : public std::runtime_error {
 public:
  explicit GeofenceLookupFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Concurrent commit touched the same rows. Absorbed by the catalog coordinator.
class StoreConflict : public std::runtime_error {
 public:
  explicit StoreConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Commit retries exhausted under contention. Retryable by the caller.
class StoreBusy : public std::runtime_error {
 public:
  explicit StoreBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace artscan::util
