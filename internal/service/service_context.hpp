#pragma once

#include <memory>

#include "internal/config/recognition_settings.hpp"

namespace artscan::db {
class Repository;
}
namespace artscan::recognition {
class EmbeddingGateway;
class GeofenceValidator;
class VectorMatchEngine;
class FallbackDispatcher;
} // namespace artscan::recognition
namespace artscan::catalog {
class AutoCatalogCoordinator;
}
namespace artscan::ledger {
class ScanLedger;
class IssueTracker;
} // namespace artscan::ledger
namespace artscan::storage {
class ImageStore;
}

namespace artscan::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<artscan::db::Repository> repository;

  std::shared_ptr<artscan::recognition::EmbeddingGateway>   gateway;
  std::shared_ptr<artscan::recognition::GeofenceValidator>  geofence;
  std::shared_ptr<artscan::recognition::VectorMatchEngine>  match_engine;
  std::shared_ptr<artscan::recognition::FallbackDispatcher> dispatcher;
  std::shared_ptr<artscan::catalog::AutoCatalogCoordinator> coordinator;

  std::shared_ptr<artscan::ledger::ScanLedger>   ledger;
  std::shared_ptr<artscan::ledger::IssueTracker> issues;

  std::shared_ptr<artscan::storage::ImageStore> images;

  artscan::config::RecognitionSettings settings;
};

} // namespace artscan::service
