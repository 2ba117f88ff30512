#pragma once

#include <grpcpp/impl/service_type.h>

#include <chrono>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/recognition_settings.hpp"
#include "internal/service/service_context.hpp"

namespace artscan::db {
class Repository;
}
namespace artscan::inference {
class EmbeddingModel;
class VisionAnalyzer;
} // namespace artscan::inference
namespace artscan::service {
class ScanService;
class AdminService;
} // namespace artscan::service
namespace artscan::storage {
class ImageStore;
}

namespace artscan::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::ScanService>  scan_service;
  std::shared_ptr<service::AdminService> admin_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Wires the recognition pipeline around already-built collaborators.
  Used by Build and by tests that substitute their own models or store.
*/
service::ServiceContext BuildServiceContext(std::shared_ptr<db::Repository> repository, std::shared_ptr<inference::EmbeddingModel> model,
                                            std::shared_ptr<inference::VisionAnalyzer> analyzer, std::shared_ptr<storage::ImageStore> images,
                                            const config::RecognitionSettings& settings,
                                            std::chrono::milliseconds embed_retry_backoff = std::chrono::milliseconds(100));

/*
  Composition root. The only place that knows the concrete store,
  inference and image backends.
*/
Application Build(const artscan::runtime::config::RuntimeConfig& config);

} // namespace artscan::factory
