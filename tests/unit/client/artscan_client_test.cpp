#include "client/cpp/artscan_client.h"

#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/scan_server.hpp"
#include "internal/inference/fake_inference.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/scan_service.hpp"
#include "internal/storage/image/memory_image_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using artscan::client::ArtScanClient;

constexpr std::size_t kDim = 8;

class UnreachableModel final : public artscan::inference::EmbeddingModel {
 public:
  std::vector<float> Embed(const artscan::inference::ImageInput&) override {
    throw artscan::util::TransientError("connection refused");
  }
};

// In-process server over the real service stack.
struct Harness {
  std::unique_ptr<::grpc::Server> server;
  std::unique_ptr<ArtScanClient>  client;

  explicit Harness(std::shared_ptr<artscan::inference::EmbeddingModel> model = nullptr) {
    artscan::config::RecognitionSettings settings;
    settings.embedding_dimension = kDim;
    if (!model) {
      model = std::make_shared<artscan::inference::FakeEmbeddingModel>(kDim);
    }

    auto ctx = artscan::factory::BuildServiceContext(std::make_shared<artscan::db::memory::MemoryRepository>(kDim), std::move(model),
                                                     std::make_shared<artscan::inference::FakeVisionAnalyzer>(),
                                                     std::make_shared<artscan::storage::MemoryImageStore>(), settings,
                                                     std::chrono::milliseconds(0));
    scan_server_  = std::make_unique<artscan::grpc::ScanServer>(std::make_shared<artscan::service::ScanService>(ctx));
    admin_server_ = std::make_unique<artscan::grpc::AdminServer>(std::make_shared<artscan::service::AdminService>(ctx));

    ::grpc::ServerBuilder builder;
    builder.RegisterService(scan_server_.get());
    builder.RegisterService(admin_server_.get());
    server = builder.BuildAndStart();
    assert(server);

    client = std::make_unique<ArtScanClient>(server->InProcessChannel(::grpc::ChannelArguments()));
  }

  ~Harness() {
    server->Shutdown();
  }

 private:
  std::unique_ptr<artscan::grpc::ScanServer>  scan_server_;
  std::unique_ptr<artscan::grpc::AdminServer> admin_server_;
};

std::string Png(const std::string& tag) {
  return std::string("\x89PNG\r\n\x1A\n", 8) + tag;
}

void TestScanThenMatchThroughClient() {
  Harness h;

  const auto first = h.client->SubmitScan(Png("night-cafe"), 0.0, 0.0, "visitor-1");
  assert(first.ok());
  assert(first->status() == artscan::v1::SCAN_STATUS_AI_ANALYSIS);

  const auto second = h.client->SubmitScan(Png("night-cafe"), 0.0, 0.0, "visitor-1");
  assert(second.ok());
  assert(second->status() == artscan::v1::SCAN_STATUS_COMMUNITY_RESULT);
  assert(second->artwork().id() == first->artwork().id());

  const auto history = h.client->ListScans("visitor-1");
  assert(history.ok());
  assert(history->events_size() == 2);
}

void TestMuseumAndArtworkAdministration() {
  Harness h;

  const auto museum = h.client->CreateMuseum("Orsay", 48.86, 2.3266, 150.0);
  assert(museum.ok());
  assert(museum->geofence_radius_meters() == 150.0);

  const auto museums = h.client->ListMuseums();
  assert(museums.ok());
  assert(museums->museums_size() == 1);

  const auto missing = h.client->GetArtwork(99);
  assert(!missing.ok());
  assert(missing.status().IsKeyError());
}

void TestInvalidImageMapsToInvalid() {
  Harness h;

  const auto resp = h.client->SubmitScan("not an image", 0.0, 0.0, "visitor-1");
  assert(!resp.ok());
  assert(resp.status().IsInvalid());
}

void TestEmbeddingOutageIsRetryable() {
  Harness h(std::make_shared<UnreachableModel>());

  const auto resp = h.client->SubmitScan(Png("outage"), 0.0, 0.0, "visitor-1");
  assert(!resp.ok());
  assert(resp.status().IsIOError());
  assert(resp.status().message().find("(retryable)") != std::string::npos);
}

void TestResolveTwiceIsRejected() {
  Harness h;

  const auto scan = h.client->SubmitScan(Png("disputed"), 0.0, 0.0, "visitor-1");
  assert(scan.ok());
  const auto report = h.client->ReportIssue(scan->artwork().id(), "visitor-1", artscan::v1::ISSUE_KIND_NOT_ARTWORK);
  assert(report.ok());

  artscan::v1::ResolveIssueRequest req;
  req.set_report_id(report->id());
  req.set_outcome(artscan::v1::RESOLVE_OUTCOME_DISMISS);
  assert(h.client->ResolveIssue(req).ok());

  const auto again = h.client->ResolveIssue(req);
  assert(!again.ok());
  assert(again.status().IsInvalid());
}

} // namespace

int main() {
  TestScanThenMatchThroughClient();
  TestMuseumAndArtworkAdministration();
  TestInvalidImageMapsToInvalid();
  TestEmbeddingOutageIsRetryable();
  TestResolveTwiceIsRejected();

  std::cout << "artscan_unit_client_artscan_client: pass\n";
  return 0;
}
