#include "internal/ledger/issue_tracker.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/scan_ledger.hpp"
#include "internal/model/description.hpp"
#include "internal/util/errors.hpp"

namespace {

using artscan::db::memory::MemoryRepository;
using artscan::ledger::ArtworkCorrection;
using artscan::ledger::IssueTracker;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  IssueTracker                      tracker{repo, [] { return uint64_t{2'000}; }};
  int64_t                           artwork_id = 0;

  Fixture() {
    auto                              tx = repo->Begin();
    artscan::db::model::ArtworkRecord artwork;
    artwork.title            = "Harbour at Dusk";
    artwork.artist           = "Unknown";
    artwork.description_json = R"({"style":"impressionism"})";
    artwork.embedding        = {1.0f, 0.0f};
    artwork.confidence_score = 0.6;
    assert(repo->InsertArtwork(*tx, artwork));
    tx->Commit();
    artwork_id = artwork.id;
  }

  std::optional<artscan::db::model::ArtworkRecord> Artwork() {
    auto tx      = repo->Begin();
    auto artwork = repo->GetArtwork(*tx, artwork_id);
    tx->Commit();
    return artwork;
  }

  int64_t Report() {
    return tracker.ReportIssue(artwork_id, "visitor-1", artscan::v1::ISSUE_KIND_WRONG_TITLE, "title is wrong").id;
  }
};

void TestReportIsOpen() {
  Fixture f;
  auto    report = f.tracker.ReportIssue(f.artwork_id, "visitor-1", artscan::v1::ISSUE_KIND_WRONG_ARTIST, "");
  assert(report.id > 0);
  assert(report.state == artscan::v1::ISSUE_STATE_OPEN);
  assert(report.created_at_ms == 2'000);
  assert(report.resolved_at_ms == 0);
}

void TestReportForUnknownArtworkFails() {
  Fixture f;
  bool    threw = false;
  try {
    f.tracker.ReportIssue(f.artwork_id + 100, "visitor-1", artscan::v1::ISSUE_KIND_WRONG_TITLE, "");
  } catch (const artscan::util::ArtworkNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReportRequiresKind() {
  Fixture f;
  bool    threw = false;
  try {
    f.tracker.ReportIssue(f.artwork_id, "visitor-1", artscan::v1::ISSUE_KIND_UNSPECIFIED, "");
  } catch (const artscan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestDismissLeavesArtwork() {
  Fixture    f;
  const auto result = f.tracker.ResolveIssue(f.Report(), artscan::v1::RESOLVE_OUTCOME_DISMISS);
  assert(result.report.state == artscan::v1::ISSUE_STATE_DISMISSED);
  assert(result.report.resolved_at_ms == 2'000);
  assert(!result.artwork_deleted);
  assert(f.Artwork()->title == "Harbour at Dusk");
}

void TestApplyCorrectionMergesDescription() {
  Fixture f;

  ArtworkCorrection correction;
  correction.title       = "Harbour at Dawn";
  correction.description = artscan::model::JsonToStruct(R"({"medium":"oil on canvas"})");

  const auto result = f.tracker.ResolveIssue(f.Report(), artscan::v1::RESOLVE_OUTCOME_APPLY_CORRECTION, correction);
  assert(result.report.state == artscan::v1::ISSUE_STATE_RESOLVED);
  assert(result.artwork.has_value());

  const auto stored = f.Artwork();
  assert(stored->title == "Harbour at Dawn");
  assert(stored->artist == "Unknown");
  const auto description = artscan::model::JsonToStruct(stored->description_json);
  assert(description.fields().at("style").string_value() == "impressionism");
  assert(description.fields().at("medium").string_value() == "oil on canvas");
}

void TestEmptyCorrectionIsRejected() {
  Fixture    f;
  const auto report_id = f.Report();

  bool threw = false;
  try {
    f.tracker.ResolveIssue(report_id, artscan::v1::RESOLVE_OUTCOME_APPLY_CORRECTION);
  } catch (const artscan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // the report stays open
  const auto open = f.tracker.ListIssues(artscan::v1::ISSUE_STATE_OPEN, artscan::db::Pagination{0, 0});
  assert(open.size() == 1);
}

void TestDeleteArtworkDetachesScans() {
  Fixture                     f;
  artscan::ledger::ScanLedger ledger(f.repo);
  ledger.Record("visitor-1", f.artwork_id, "", artscan::v1::SCAN_STATUS_COMMUNITY_RESULT);

  const auto result = f.tracker.ResolveIssue(f.Report(), artscan::v1::RESOLVE_OUTCOME_DELETE_ARTWORK);
  assert(result.artwork_deleted);
  assert(!f.Artwork().has_value());

  const auto scans = ledger.List("visitor-1", artscan::db::Pagination{0, 0});
  assert(scans.size() == 1);
  assert(!scans[0].artwork_id.has_value());
}

void TestVerifyPromotesArtwork() {
  Fixture    f;
  const auto result = f.tracker.ResolveIssue(f.Report(), artscan::v1::RESOLVE_OUTCOME_VERIFY);
  assert(result.artwork.has_value());

  const auto stored = f.Artwork();
  assert(stored->is_verified);
  assert(stored->source == artscan::v1::ARTWORK_SOURCE_ADMIN);
}

void TestResolvingTwiceIsInvalidState() {
  Fixture    f;
  const auto report_id = f.Report();
  f.tracker.ResolveIssue(report_id, artscan::v1::RESOLVE_OUTCOME_DISMISS);

  bool threw = false;
  try {
    f.tracker.ResolveIssue(report_id, artscan::v1::RESOLVE_OUTCOME_VERIFY);
  } catch (const artscan::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!f.Artwork()->is_verified);
}

void TestUnknownReportIsNotFound() {
  Fixture f;
  bool    threw = false;
  try {
    f.tracker.ResolveIssue(999, artscan::v1::RESOLVE_OUTCOME_DISMISS);
  } catch (const artscan::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListFiltersByState() {
  Fixture f;
  f.Report();
  const auto second = f.Report();
  f.tracker.ResolveIssue(second, artscan::v1::RESOLVE_OUTCOME_DISMISS);

  assert(f.tracker.ListIssues(std::nullopt, artscan::db::Pagination{0, 0}).size() == 2);
  assert(f.tracker.ListIssues(artscan::v1::ISSUE_STATE_OPEN, artscan::db::Pagination{0, 0}).size() == 1);
  const auto dismissed = f.tracker.ListIssues(artscan::v1::ISSUE_STATE_DISMISSED, artscan::db::Pagination{0, 0});
  assert(dismissed.size() == 1);
  assert(dismissed[0].id == second);
}

} // namespace

int main() {
  TestReportIsOpen();
  TestReportForUnknownArtworkFails();
  TestReportRequiresKind();
  TestDismissLeavesArtwork();
  TestApplyCorrectionMergesDescription();
  TestEmptyCorrectionIsRejected();
  TestDeleteArtworkDetachesScans();
  TestVerifyPromotesArtwork();
  TestResolvingTwiceIsInvalidState();
  TestUnknownReportIsNotFound();
  TestListFiltersByState();

  std::cout << "artscan_unit_issue_tracker: pass\n";
  return 0;
}
