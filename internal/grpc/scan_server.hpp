#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "artscan/services/v1/scan_service.grpc.pb.h"
#include "internal/service/scan_service.hpp"

namespace artscan::grpc {

class ScanServer final : public artscan::services::v1::ScanService::Service {
 public:
  explicit ScanServer(std::shared_ptr<artscan::service::ScanService> svc);

  ::grpc::Status SubmitScan(::grpc::ServerContext* ctx, const artscan::services::v1::SubmitScanRequest* req,
                            artscan::services::v1::SubmitScanResponse* resp) override;

  ::grpc::Status ReportIssue(::grpc::ServerContext* ctx, const artscan::services::v1::ReportIssueRequest* req,
                             artscan::services::v1::ReportIssueResponse* resp) override;

 private:
  std::shared_ptr<artscan::service::ScanService> service_;
};

} // namespace artscan::grpc
