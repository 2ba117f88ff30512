#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "artscan/v1.hpp"
#include "service_context.hpp"

namespace artscan::service {

/*
  AdminService

  Curator operations: museums, verified artworks, moderation of issue
  reports and read access to the scan history.
*/
class AdminService {
 public:
  static constexpr uint32_t kDefaultPageSize = 100;

  explicit AdminService(ServiceContext ctx);

  artscan::v1::CreateMuseumResponse  CreateMuseum(const artscan::v1::CreateMuseumRequest& req);
  artscan::v1::ListMuseumsResponse   ListMuseums(const artscan::v1::ListMuseumsRequest& req);
  artscan::v1::CreateArtworkResponse CreateArtwork(const artscan::v1::CreateArtworkRequest& req);
  artscan::v1::GetArtworkResponse    GetArtwork(const artscan::v1::GetArtworkRequest& req);
  artscan::v1::ListIssuesResponse    ListIssues(const artscan::v1::ListIssuesRequest& req);
  artscan::v1::ResolveIssueResponse  ResolveIssue(const artscan::v1::ResolveIssueRequest& req);
  artscan::v1::ListScansResponse     ListScans(const artscan::v1::ListScansRequest& req);

 private:
  std::vector<float> ResolveEmbedding(const artscan::v1::CreateArtworkRequest& req, std::string& image_url);

  ServiceContext ctx_;
};

} // namespace artscan::service
