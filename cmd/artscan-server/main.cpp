#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/recognition_settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

const char* DatabaseBackendName(const artscan::runtime::config::DatabaseConfig& database) {
  if (database.has_postgres()) {
    return "postgres";
  }
  if (database.has_sqlite()) {
    return "sqlite";
  }
  return "memory";
}

// Flushes exporters and the log sink on every exit path out of main.
struct ObservabilityGuard {
  ~ObservabilityGuard() {
    artscan::observability::ShutdownLogging();
    artscan::observability::ShutdownMetrics();
    artscan::observability::ShutdownTracing();
  }
};

void Serve(const std::string& config_path) {
  auto config = artscan::config::ConfigLoader::LoadFromYaml(config_path);
  artscan::observability::InitializeTracing(config);
  artscan::observability::InitializeMetrics(config);
  artscan::observability::InitializeLogging(config);

  const auto settings = artscan::config::ResolveRecognitionSettings(config);
  auto       app      = artscan::factory::Build(config);

  artscan::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  std::signal(SIGINT, RequestStop);
  std::signal(SIGTERM, RequestStop);
  server.Start();

  ARTSCAN_LOG_INFO("artscan serving", {artscan::observability::StringField("bind_address", config.server().bind_address()),
                                       artscan::observability::StringField("database", DatabaseBackendName(config.database())),
                                       artscan::observability::DoubleField("distance_threshold", settings.distance_threshold),
                                       artscan::observability::IntField("embedding_dimension", static_cast<std::int64_t>(settings.embedding_dimension))});

  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  ARTSCAN_LOG_INFO("artscan draining in-flight requests");
  server.Stop();
}

int Run(const std::string& config_path) {
  ObservabilityGuard guard;
  try {
    Serve(config_path);
  } catch (const std::exception& e) {
    ARTSCAN_LOG_ERROR("artscan failed to serve", {artscan::observability::StringField("error", e.what())});
    return 2;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "usage: artscan-server [--config] <config.yaml>\n";
    return 1;
  }

  return Run(config_path);
}
