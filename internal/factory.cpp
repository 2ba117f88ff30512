#include "factory.hpp"

#include <grpcpp/grpcpp.h>

#include <stdexcept>
#include <string>

#include "internal/catalog/auto_catalog_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/scan_server.hpp"
#include "internal/inference/fake_inference.hpp"
#include "internal/inference/grpc_inference.hpp"
#include "internal/ledger/issue_tracker.hpp"
#include "internal/ledger/scan_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recognition/embedding_gateway.hpp"
#include "internal/recognition/fallback_dispatcher.hpp"
#include "internal/recognition/geofence_validator.hpp"
#include "internal/recognition/vector_match_engine.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/scan_service.hpp"
#include "internal/storage/image/arrow_image_store.hpp"
#include "internal/storage/image/memory_image_store.hpp"
#if ARTSCAN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if ARTSCAN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace artscan::factory {

using artscan::observability::BoolField;
using artscan::observability::IntField;
using artscan::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kDefaultEmbedDeadline{5000};
constexpr std::chrono::milliseconds kDefaultAnalysisDeadline{30000};
constexpr std::chrono::milliseconds kDefaultRetryBackoff{100};

std::chrono::milliseconds OrDefault(uint32_t value_ms, std::chrono::milliseconds fallback) {
  return value_ms > 0 ? std::chrono::milliseconds(value_ms) : fallback;
}

std::shared_ptr<db::Repository> BuildRepository(const artscan::runtime::config::RuntimeConfig& config, std::size_t dimension) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ARTSCAN_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    ARTSCAN_LOG_INFO("catalog store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), dimension);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ARTSCAN_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool, dimension);
    ARTSCAN_LOG_INFO("catalog store ready", {StringField("backend", "postgres"), IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), dimension);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ARTSCAN_LOG_INFO("catalog store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>(dimension);
}

std::shared_ptr<inference::EmbeddingModel> BuildEmbeddingModel(const artscan::runtime::config::InferenceEndpointConfig& config,
                                                               std::size_t dimension) {
  if (config.fake()) {
    ARTSCAN_LOG_WARN("using deterministic fake embedding model", {IntField("dimension", static_cast<int64_t>(dimension))});
    return std::make_shared<inference::FakeEmbeddingModel>(dimension);
  }
  auto channel = ::grpc::CreateChannel(config.endpoint(), ::grpc::InsecureChannelCredentials());
  return std::make_shared<inference::GrpcEmbeddingModel>(std::move(channel), OrDefault(config.deadline_ms(), kDefaultEmbedDeadline));
}

std::shared_ptr<inference::VisionAnalyzer> BuildVisionAnalyzer(const artscan::runtime::config::InferenceEndpointConfig& config) {
  if (config.fake()) {
    ARTSCAN_LOG_WARN("using deterministic fake vision analyzer");
    return std::make_shared<inference::FakeVisionAnalyzer>();
  }
  auto channel = ::grpc::CreateChannel(config.endpoint(), ::grpc::InsecureChannelCredentials());
  return std::make_shared<inference::GrpcVisionAnalyzer>(std::move(channel), OrDefault(config.deadline_ms(), kDefaultAnalysisDeadline));
}

std::shared_ptr<storage::ImageStore> BuildImageStore(const artscan::runtime::config::ImageStoreConfig& config) {
  if (config.root_path().empty()) {
    ARTSCAN_LOG_WARN("image store root not configured, keeping images in memory");
    return std::make_shared<storage::MemoryImageStore>();
  }
  return std::make_shared<storage::ArrowImageStore>(config.root_path(), config.public_base_url());
}

} // namespace

service::ServiceContext BuildServiceContext(std::shared_ptr<db::Repository> repository, std::shared_ptr<inference::EmbeddingModel> model,
                                            std::shared_ptr<inference::VisionAnalyzer> analyzer, std::shared_ptr<storage::ImageStore> images,
                                            const config::RecognitionSettings& settings, std::chrono::milliseconds embed_retry_backoff) {
  service::ServiceContext ctx;
  ctx.repository   = repository;
  ctx.settings     = settings;
  ctx.images       = std::move(images);
  ctx.gateway      = std::make_shared<recognition::EmbeddingGateway>(std::move(model), settings.embedding_dimension, embed_retry_backoff);
  ctx.geofence     = std::make_shared<recognition::GeofenceValidator>(repository);
  ctx.match_engine = std::make_shared<recognition::VectorMatchEngine>(repository, settings);
  ctx.dispatcher   = std::make_shared<recognition::FallbackDispatcher>(std::move(analyzer));
  ctx.coordinator  = std::make_shared<catalog::AutoCatalogCoordinator>(repository, ctx.match_engine, settings);
  ctx.ledger       = std::make_shared<ledger::ScanLedger>(repository);
  ctx.issues       = std::make_shared<ledger::IssueTracker>(repository);
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const artscan::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto settings = config::ResolveRecognitionSettings(config);

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config, settings.embedding_dimension);
  auto model      = BuildEmbeddingModel(config.embedding(), settings.embedding_dimension);
  auto analyzer   = BuildVisionAnalyzer(config.analysis());
  auto images     = BuildImageStore(config.images());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context = BuildServiceContext(std::move(repository), std::move(model), std::move(analyzer), std::move(images), settings,
                                    OrDefault(config.embedding().retry_backoff_ms(), kDefaultRetryBackoff));

  app.scan_service  = std::make_shared<service::ScanService>(app.context);
  app.admin_service = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<::grpc::ScanServer>(app.scan_service));
  app.grpc_services.push_back(std::make_unique<::grpc::AdminServer>(app.admin_service));

  ARTSCAN_LOG_INFO("recognition pipeline configured",
                   {observability::DoubleField("distance_threshold", settings.distance_threshold),
                    IntField("embedding_dimension", static_cast<int64_t>(settings.embedding_dimension)),
                    BoolField("legacy_match_status", settings.legacy_match_status)});
  return app;
}

} // namespace artscan::factory
