#include "scan_server.hpp"

#include "grpc_error.hpp"

namespace artscan::grpc {

ScanServer::ScanServer(std::shared_ptr<artscan::service::ScanService> svc) : service_(std::move(svc)) {
}

::grpc::Status ScanServer::SubmitScan(::grpc::ServerContext* ctx, const artscan::services::v1::SubmitScanRequest* req,
                                      artscan::services::v1::SubmitScanResponse* resp) {
  try {
    const artscan::util::CancellationToken cancel([ctx] { return ctx->IsCancelled(); });
    *resp = service_->SubmitScan(*req, cancel);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ScanServer::ReportIssue(::grpc::ServerContext* ctx, const artscan::services::v1::ReportIssueRequest* req,
                                       artscan::services::v1::ReportIssueResponse* resp) {
  try {
    *resp = service_->ReportIssue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace artscan::grpc
