#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "artscan/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace artscan::grpc {

class AdminServer final : public artscan::services::v1::CatalogAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<artscan::service::AdminService> svc);

  ::grpc::Status CreateMuseum(::grpc::ServerContext*, const artscan::services::v1::CreateMuseumRequest*,
                              artscan::services::v1::CreateMuseumResponse*) override;

  ::grpc::Status ListMuseums(::grpc::ServerContext*, const artscan::services::v1::ListMuseumsRequest*,
                             artscan::services::v1::ListMuseumsResponse*) override;

  ::grpc::Status CreateArtwork(::grpc::ServerContext*, const artscan::services::v1::CreateArtworkRequest*,
                               artscan::services::v1::CreateArtworkResponse*) override;

  ::grpc::Status GetArtwork(::grpc::ServerContext*, const artscan::services::v1::GetArtworkRequest*,
                            artscan::services::v1::GetArtworkResponse*) override;

  ::grpc::Status ListIssues(::grpc::ServerContext*, const artscan::services::v1::ListIssuesRequest*,
                            artscan::services::v1::ListIssuesResponse*) override;

  ::grpc::Status ResolveIssue(::grpc::ServerContext*, const artscan::services::v1::ResolveIssueRequest*,
                              artscan::services::v1::ResolveIssueResponse*) override;

  ::grpc::Status ListScans(::grpc::ServerContext*, const artscan::services::v1::ListScansRequest*,
                           artscan::services::v1::ListScansResponse*) override;

 private:
  std::shared_ptr<artscan::service::AdminService> service_;
};

} // namespace artscan::grpc
