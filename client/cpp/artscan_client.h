#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "artscan/services/v1/admin_service.grpc.pb.h"
#include "artscan/services/v1/scan_service.grpc.pb.h"
#include "artscan/v1.hpp"

namespace artscan::client {

/*
  Thin synchronous wrapper over the ScanService and CatalogAdminService
  stubs. gRPC failures come back as arrow::Status carrying the server
  message; UNAVAILABLE replies flagged retryable by the server say so.
*/
class ArtScanClient {
 public:
  explicit ArtScanClient(std::shared_ptr<::grpc::Channel> channel);

  // ------------------------------------------------------------------
  // Visitors
  // ------------------------------------------------------------------

  arrow::Result<artscan::v1::SubmitScanResponse> SubmitScan(const std::string& image_bytes, double latitude, double longitude,
                                                            const std::string& user_id) const;

  arrow::Result<artscan::v1::IssueReport> ReportIssue(int64_t artwork_id, const std::string& user_id, artscan::v1::IssueKind kind,
                                                      const std::string& note = {}) const;

  // ------------------------------------------------------------------
  // Administrators
  // ------------------------------------------------------------------

  arrow::Result<artscan::v1::Museum> CreateMuseum(const std::string& name, double latitude, double longitude, double radius_meters) const;

  arrow::Result<artscan::v1::ListMuseumsResponse> ListMuseums() const;

  arrow::Result<artscan::v1::Artwork> CreateArtwork(const artscan::v1::CreateArtworkRequest& request) const;

  arrow::Result<artscan::v1::Artwork> GetArtwork(int64_t id) const;

  arrow::Result<artscan::v1::ListIssuesResponse> ListIssues(const artscan::v1::ListIssuesRequest& request) const;

  arrow::Result<artscan::v1::ResolveIssueResponse> ResolveIssue(const artscan::v1::ResolveIssueRequest& request) const;

  arrow::Result<artscan::v1::ListScansResponse> ListScans(const std::string& user_id, uint32_t limit = 0, uint32_t offset = 0) const;

 private:
  std::unique_ptr<artscan::v1::ScanService::Stub>         scan_stub_;
  std::unique_ptr<artscan::v1::CatalogAdminService::Stub> admin_stub_;
};

} // namespace artscan::client
