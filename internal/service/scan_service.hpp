#pragma once

#include <optional>

#include "artscan/v1.hpp"
#include "internal/util/cancellation.hpp"
#include "service_context.hpp"

namespace artscan::service {

/*
  ScanService

  Visitor-facing recognition pipeline:

    validate image -> store image -> embed -> geofence -> match
      match:    record scan, return the matched artwork
      no match: analyze
                  not art: record scan without artwork
                  art:     get-or-create catalog entry, record scan

  Every SubmitScan ends in exactly one terminal status or an exception.
*/
class ScanService {
 public:
  static constexpr const char* kAnonymousUser = "anonymous";

  explicit ScanService(ServiceContext ctx);

  artscan::v1::SubmitScanResponse SubmitScan(const artscan::v1::SubmitScanRequest& req,
                                             const util::CancellationToken& cancel = util::CancellationToken());

  artscan::v1::ReportIssueResponse ReportIssue(const artscan::v1::ReportIssueRequest& req);

 private:
  artscan::v1::SubmitScanResponse RunPipeline(const artscan::v1::SubmitScanRequest& req, const std::string& user_id,
                                              const util::CancellationToken& cancel);

  // Ledger failures after a successful recognition are logged only.
  int64_t RecordScan(const std::string& user_id, std::optional<int64_t> artwork_id, const std::string& image_url,
                     artscan::v1::ScanStatus status);

  ServiceContext ctx_;
};

} // namespace artscan::service
