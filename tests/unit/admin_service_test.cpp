#include "internal/service/admin_service.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/inference/fake_inference.hpp"
#include "internal/model/description.hpp"
#include "internal/service/scan_service.hpp"
#include "internal/storage/image/memory_image_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using artscan::service::AdminService;
using artscan::service::ScanService;
using namespace artscan::v1;

constexpr std::size_t kDim = 8;

std::string Png(const std::string& tag) {
  return std::string("\x89PNG\r\n\x1A\n", 8) + tag;
}

struct Fixture {
  std::shared_ptr<artscan::storage::MemoryImageStore> images = std::make_shared<artscan::storage::MemoryImageStore>();
  std::unique_ptr<AdminService>                       admin;
  std::unique_ptr<ScanService>                        scans;

  Fixture() {
    artscan::config::RecognitionSettings settings;
    settings.embedding_dimension = kDim;

    auto ctx = artscan::factory::BuildServiceContext(std::make_shared<artscan::db::memory::MemoryRepository>(kDim),
                                                     std::make_shared<artscan::inference::FakeEmbeddingModel>(kDim),
                                                     std::make_shared<artscan::inference::FakeVisionAnalyzer>(), images, settings,
                                                     std::chrono::milliseconds(0));
    admin = std::make_unique<AdminService>(ctx);
    scans = std::make_unique<ScanService>(ctx);
  }

  Museum AddMuseum(const std::string& name, double radius = 0.0) {
    CreateMuseumRequest req;
    req.set_name(name);
    req.mutable_location()->set_latitude(40.7794);
    req.mutable_location()->set_longitude(-73.9632);
    req.set_geofence_radius_meters(radius);
    return admin->CreateMuseum(req).museum();
  }

  int64_t ReportOnScannedArtwork(const std::string& image) {
    SubmitScanRequest scan;
    scan.set_image(Png(image));
    scan.set_user_id("visitor-1");
    const auto artwork_id = scans->SubmitScan(scan).artwork().id();

    ReportIssueRequest report;
    report.set_artwork_id(artwork_id);
    report.set_user_id("visitor-1");
    report.set_kind(ISSUE_KIND_WRONG_TITLE);
    return scans->ReportIssue(report).report().id();
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateMuseumDefaultsRadius() {
  Fixture f;

  const auto museum = f.AddMuseum("Metropolitan");
  assert(museum.id() > 0);
  assert(museum.geofence_radius_meters() == 100.0);

  const auto custom = f.AddMuseum("Guggenheim", 350.0);
  assert(custom.geofence_radius_meters() == 350.0);

  assert(f.admin->ListMuseums(ListMuseumsRequest()).museums_size() == 2);
}

void TestCreateMuseumValidatesInput() {
  Fixture f;
  assert(Throws<artscan::util::InvalidArgument>([&] { f.AddMuseum(""); }));

  CreateMuseumRequest req;
  req.set_name("Nowhere");
  req.mutable_location()->set_latitude(123.0);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateMuseum(req); }));

  assert(Throws<artscan::util::InvalidArgument>([&] { f.AddMuseum("Negative", -5.0); }));
}

void TestCreateArtworkFromImage() {
  Fixture    f;
  const auto museum = f.AddMuseum("Metropolitan");

  CreateArtworkRequest req;
  req.set_museum_id(museum.id());
  req.set_title("Wheat Field with Cypresses");
  req.set_artist("Vincent van Gogh");
  req.set_image(Png("wheat-field"));
  req.set_source(ARTWORK_SOURCE_MUSEUM_API);
  (*req.mutable_description()->mutable_fields())["year"].set_number_value(1889);

  const auto artwork = f.admin->CreateArtwork(req).artwork();
  assert(artwork.id() > 0);
  assert(artwork.is_verified());
  assert(artwork.tier() == MATCH_TIER_VERIFIED);
  assert(artwork.museum_id() == museum.id());
  assert(!artwork.has_confidence_score());
  assert(artwork.image_url().rfind("memory://", 0) == 0);
  assert(artwork.description().fields().at("year").number_value() == 1889);
  assert(f.images->Size() == 1);

  GetArtworkRequest get;
  get.set_id(artwork.id());
  assert(f.admin->GetArtwork(get).artwork().title() == "Wheat Field with Cypresses");

  // the same picture scanned inside the museum resolves to the verified entry
  SubmitScanRequest scan;
  scan.set_image(Png("wheat-field"));
  scan.set_latitude(40.7794);
  scan.set_longitude(-73.9632);
  const auto resp = f.scans->SubmitScan(scan);
  assert(resp.status() == SCAN_STATUS_VERIFIED_RESULT);
  assert(resp.artwork().id() == artwork.id());
}

void TestCreateArtworkFromEmbedding() {
  Fixture f;

  CreateArtworkRequest req;
  req.set_title("Precomputed");
  req.set_image_url("https://images.example.org/precomputed.jpg");
  req.set_source(ARTWORK_SOURCE_ADMIN);
  for (std::size_t i = 0; i < kDim; ++i) {
    req.add_embedding(i == 2 ? 3.0f : 0.0f);
  }

  const auto artwork = f.admin->CreateArtwork(req).artwork();
  assert(artwork.image_url() == "https://images.example.org/precomputed.jpg");
  assert(!artwork.has_museum_id());
  assert(f.images->Size() == 0);
}

void TestCreateArtworkRejectsBadRequests() {
  Fixture f;

  CreateArtworkRequest missing_title;
  missing_title.set_image(Png("x"));
  missing_title.set_source(ARTWORK_SOURCE_ADMIN);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateArtwork(missing_title); }));

  CreateArtworkRequest ai_source;
  ai_source.set_title("Not allowed");
  ai_source.set_image(Png("x"));
  ai_source.set_source(ARTWORK_SOURCE_AI_GENERATED);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateArtwork(ai_source); }));

  CreateArtworkRequest no_pixels;
  no_pixels.set_title("Nothing to embed");
  no_pixels.set_source(ARTWORK_SOURCE_ADMIN);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateArtwork(no_pixels); }));

  CreateArtworkRequest short_embedding = no_pixels;
  short_embedding.add_embedding(1.0f);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateArtwork(short_embedding); }));

  CreateArtworkRequest bad_image = no_pixels;
  bad_image.set_image("not an image");
  assert(Throws<artscan::util::InvalidImage>([&] { f.admin->CreateArtwork(bad_image); }));

  CreateArtworkRequest unknown_museum = no_pixels;
  unknown_museum.set_image(Png("x"));
  unknown_museum.set_museum_id(404);
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->CreateArtwork(unknown_museum); }));
}

void TestGetUnknownArtwork() {
  Fixture           f;
  GetArtworkRequest req;
  req.set_id(77);
  assert(Throws<artscan::util::ArtworkNotFound>([&] { f.admin->GetArtwork(req); }));
}

void TestResolveIssueWithCorrection() {
  Fixture    f;
  const auto report_id = f.ReportOnScannedArtwork("dancers");

  ListIssuesRequest open;
  open.set_state(ISSUE_STATE_OPEN);
  assert(f.admin->ListIssues(open).reports_size() == 1);

  ResolveIssueRequest req;
  req.set_report_id(report_id);
  req.set_outcome(RESOLVE_OUTCOME_APPLY_CORRECTION);
  req.mutable_correction()->set_title("The Dance Class");
  req.mutable_correction()->set_artist("Edgar Degas");

  const auto resp = f.admin->ResolveIssue(req);
  assert(resp.report().state() == ISSUE_STATE_RESOLVED);
  assert(resp.report().has_resolved_at());
  assert(resp.artwork().title() == "The Dance Class");
  assert(resp.artwork().artist() == "Edgar Degas");
  assert(!resp.artwork_deleted());

  assert(f.admin->ListIssues(open).reports_size() == 0);
  assert(f.admin->ListIssues(ListIssuesRequest()).reports_size() == 1);

  assert(Throws<artscan::util::InvalidState>([&] { f.admin->ResolveIssue(req); }));
}

void TestResolveIssueEmptyCorrection() {
  Fixture f;

  ResolveIssueRequest req;
  req.set_report_id(f.ReportOnScannedArtwork("blank-correction"));
  req.set_outcome(RESOLVE_OUTCOME_APPLY_CORRECTION);
  req.mutable_correction()->mutable_description();
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->ResolveIssue(req); }));
}

void TestResolveIssueDeleteArtwork() {
  Fixture    f;
  const auto report_id = f.ReportOnScannedArtwork("forgery");

  ResolveIssueRequest req;
  req.set_report_id(report_id);
  req.set_outcome(RESOLVE_OUTCOME_DELETE_ARTWORK);
  const auto resp = f.admin->ResolveIssue(req);
  assert(resp.artwork_deleted());
  assert(!resp.has_artwork());

  ListScansRequest scans;
  scans.set_user_id("visitor-1");
  const auto history = f.admin->ListScans(scans);
  assert(history.events_size() == 1);
  assert(!history.events(0).has_artwork_id());
}

void TestListScansRequiresUser() {
  Fixture f;
  assert(Throws<artscan::util::InvalidArgument>([&] { f.admin->ListScans(ListScansRequest()); }));
}

void TestListScansPaging() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    SubmitScanRequest scan;
    scan.set_image(Png("page-" + std::to_string(i)));
    scan.set_user_id("visitor-9");
    f.scans->SubmitScan(scan);
  }

  ListScansRequest req;
  req.set_user_id("visitor-9");
  const auto all = f.admin->ListScans(req);
  assert(all.events_size() == 3);
  assert(all.events(0).timestamp().seconds() * 1000 + all.events(0).timestamp().nanos() / 1000000 >=
         all.events(2).timestamp().seconds() * 1000 + all.events(2).timestamp().nanos() / 1000000);

  req.set_limit(1);
  req.set_offset(1);
  const auto page = f.admin->ListScans(req);
  assert(page.events_size() == 1);
  assert(page.events(0).id() == all.events(1).id());
}

} // namespace

int main() {
  TestCreateMuseumDefaultsRadius();
  TestCreateMuseumValidatesInput();
  TestCreateArtworkFromImage();
  TestCreateArtworkFromEmbedding();
  TestCreateArtworkRejectsBadRequests();
  TestGetUnknownArtwork();
  TestResolveIssueWithCorrection();
  TestResolveIssueEmptyCorrection();
  TestResolveIssueDeleteArtwork();
  TestListScansRequiresUser();
  TestListScansPaging();

  std::cout << "artscan_unit_admin_service: pass\n";
  return 0;
}
