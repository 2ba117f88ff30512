#include "client/cpp/artscan_client.h"

#include <grpcpp/client_context.h>

#include <string_view>

namespace artscan::client {

namespace {

bool FlaggedRetryable(const ::grpc::ClientContext& ctx) {
  const auto& trailers = ctx.GetServerTrailingMetadata();
  const auto  it       = trailers.find("retryable");
  return it != trailers.end() && std::string_view(it->second.data(), it->second.size()) == "true";
}

arrow::Status GrpcToArrow(const ::grpc::Status& status, const ::grpc::ClientContext& ctx, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  const std::string prefix = std::string(action) + " failed: ";
  switch (status.error_code()) {
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(prefix, status.error_message());
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(prefix, status.error_message());
    case ::grpc::StatusCode::CANCELLED:
      return arrow::Status::Cancelled(prefix, status.error_message());
    case ::grpc::StatusCode::UNAVAILABLE:
      if (FlaggedRetryable(ctx)) {
        return arrow::Status::IOError(prefix, status.error_message(), " (retryable)");
      }
      return arrow::Status::IOError(prefix, status.error_message());
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::ABORTED:
      return arrow::Status::Invalid(prefix, status.error_message());
    default:
      return arrow::Status::UnknownError(prefix, status.error_message());
  }
}

} // namespace

ArtScanClient::ArtScanClient(std::shared_ptr<::grpc::Channel> channel)
    : scan_stub_(artscan::v1::ScanService::NewStub(channel)), admin_stub_(artscan::v1::CatalogAdminService::NewStub(channel)) {
}

arrow::Result<artscan::v1::SubmitScanResponse> ArtScanClient::SubmitScan(const std::string& image_bytes, double latitude, double longitude,
                                                                         const std::string& user_id) const {
  artscan::v1::SubmitScanRequest request;
  request.set_image(image_bytes);
  request.set_latitude(latitude);
  request.set_longitude(longitude);
  request.set_user_id(user_id);

  artscan::v1::SubmitScanResponse response;
  ::grpc::ClientContext             ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(scan_stub_->SubmitScan(&ctx, request, &response), ctx, "SubmitScan"));
  return response;
}

arrow::Result<artscan::v1::IssueReport> ArtScanClient::ReportIssue(int64_t artwork_id, const std::string& user_id, artscan::v1::IssueKind kind,
                                                                   const std::string& note) const {
  artscan::v1::ReportIssueRequest request;
  request.set_artwork_id(artwork_id);
  request.set_user_id(user_id);
  request.set_kind(kind);
  request.set_note(note);

  artscan::v1::ReportIssueResponse response;
  ::grpc::ClientContext              ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(scan_stub_->ReportIssue(&ctx, request, &response), ctx, "ReportIssue"));
  return response.report();
}

arrow::Result<artscan::v1::Museum> ArtScanClient::CreateMuseum(const std::string& name, double latitude, double longitude,
                                                               double radius_meters) const {
  artscan::v1::CreateMuseumRequest request;
  request.set_name(name);
  request.mutable_location()->set_latitude(latitude);
  request.mutable_location()->set_longitude(longitude);
  request.set_geofence_radius_meters(radius_meters);

  artscan::v1::CreateMuseumResponse response;
  ::grpc::ClientContext               ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->CreateMuseum(&ctx, request, &response), ctx, "CreateMuseum"));
  return response.museum();
}

arrow::Result<artscan::v1::ListMuseumsResponse> ArtScanClient::ListMuseums() const {
  artscan::v1::ListMuseumsResponse response;
  ::grpc::ClientContext              ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListMuseums(&ctx, artscan::v1::ListMuseumsRequest{}, &response), ctx, "ListMuseums"));
  return response;
}

arrow::Result<artscan::v1::Artwork> ArtScanClient::CreateArtwork(const artscan::v1::CreateArtworkRequest& request) const {
  artscan::v1::CreateArtworkResponse response;
  ::grpc::ClientContext                ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->CreateArtwork(&ctx, request, &response), ctx, "CreateArtwork"));
  return response.artwork();
}

arrow::Result<artscan::v1::Artwork> ArtScanClient::GetArtwork(int64_t id) const {
  artscan::v1::GetArtworkRequest request;
  request.set_id(id);

  artscan::v1::GetArtworkResponse response;
  ::grpc::ClientContext             ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetArtwork(&ctx, request, &response), ctx, "GetArtwork"));
  return response.artwork();
}

arrow::Result<artscan::v1::ListIssuesResponse> ArtScanClient::ListIssues(const artscan::v1::ListIssuesRequest& request) const {
  artscan::v1::ListIssuesResponse response;
  ::grpc::ClientContext             ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListIssues(&ctx, request, &response), ctx, "ListIssues"));
  return response;
}

arrow::Result<artscan::v1::ResolveIssueResponse> ArtScanClient::ResolveIssue(const artscan::v1::ResolveIssueRequest& request) const {
  artscan::v1::ResolveIssueResponse response;
  ::grpc::ClientContext               ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ResolveIssue(&ctx, request, &response), ctx, "ResolveIssue"));
  return response;
}

arrow::Result<artscan::v1::ListScansResponse> ArtScanClient::ListScans(const std::string& user_id, uint32_t limit, uint32_t offset) const {
  artscan::v1::ListScansRequest request;
  request.set_user_id(user_id);
  request.set_limit(limit);
  request.set_offset(offset);

  artscan::v1::ListScansResponse response;
  ::grpc::ClientContext            ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListScans(&ctx, request, &response), ctx, "ListScans"));
  return response;
}

} // namespace artscan::client
