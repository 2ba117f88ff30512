#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace artscan::grpc {

namespace {

template <typename Fn>
::grpc::Status Invoke(::grpc::ServerContext* ctx, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<artscan::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::CreateMuseum(::grpc::ServerContext* ctx, const artscan::services::v1::CreateMuseumRequest* req,
                                        artscan::services::v1::CreateMuseumResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->CreateMuseum(*req); });
}

::grpc::Status AdminServer::ListMuseums(::grpc::ServerContext* ctx, const artscan::services::v1::ListMuseumsRequest* req,
                                       artscan::services::v1::ListMuseumsResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->ListMuseums(*req); });
}

::grpc::Status AdminServer::CreateArtwork(::grpc::ServerContext* ctx, const artscan::services::v1::CreateArtworkRequest* req,
                                         artscan::services::v1::CreateArtworkResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->CreateArtwork(*req); });
}

::grpc::Status AdminServer::GetArtwork(::grpc::ServerContext* ctx, const artscan::services::v1::GetArtworkRequest* req,
                                      artscan::services::v1::GetArtworkResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->GetArtwork(*req); });
}

::grpc::Status AdminServer::ListIssues(::grpc::ServerContext* ctx, const artscan::services::v1::ListIssuesRequest* req,
                                      artscan::services::v1::ListIssuesResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->ListIssues(*req); });
}

::grpc::Status AdminServer::ResolveIssue(::grpc::ServerContext* ctx, const artscan::services::v1::ResolveIssueRequest* req,
                                        artscan::services::v1::ResolveIssueResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->ResolveIssue(*req); });
}

::grpc::Status AdminServer::ListScans(::grpc::ServerContext* ctx, const artscan::services::v1::ListScansRequest* req,
                                     artscan::services::v1::ListScansResponse* resp) {
  return Invoke(ctx, [&] { *resp = service_->ListScans(*req); });
}

} // namespace artscan::grpc
