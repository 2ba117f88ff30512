#include "internal/catalog/auto_catalog_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/delegating_repository.hpp"
#include "tests/support/embeddings.hpp"

namespace {

using artscan::catalog::AutoCatalogCoordinator;
using artscan::catalog::CatalogOutcome;
using artscan::catalog::CatalogRequest;
using artscan::db::memory::MemoryRepository;
using artscan::recognition::VectorMatchEngine;

constexpr std::size_t kDim = 8;

artscan::config::RecognitionSettings Settings() {
  artscan::config::RecognitionSettings settings;
  settings.embedding_dimension = kDim;
  return settings;
}

std::shared_ptr<AutoCatalogCoordinator> MakeCoordinator(const std::shared_ptr<artscan::db::Repository>& repo) {
  auto engine = std::make_shared<VectorMatchEngine>(repo, Settings());
  return std::make_shared<AutoCatalogCoordinator>(repo, engine, Settings());
}

CatalogRequest Request(std::vector<float> embedding) {
  CatalogRequest request;
  request.embedding            = std::move(embedding);
  request.title                = "Harbour at Dusk";
  request.artist               = "Unknown";
  request.description["style"] = "impressionism";
  request.confidence           = 0.8;
  request.image_url            = "memory://images/1";
  return request;
}

std::size_t CountArtworks(artscan::db::Repository& repo) {
  auto tx    = repo.Begin();
  auto count = repo.CountArtworks(*tx);
  tx->Commit();
  return count;
}

// Commits a competing artwork right before the first insert and reports
// the coordinator's own insert as conflicting, as a unique index would.
class RacingRepository final : public artscan::testing::DelegatingRepository {
 public:
  using DelegatingRepository::DelegatingRepository;

  artscan::db::Result InsertArtwork(artscan::db::Transaction& tx, artscan::db::model::ArtworkRecord& record) override {
    if (!raced_) {
      raced_ = true;

      auto competing_tx = inner_->Begin();
      auto competing    = record;
      competing.title   = "Competing entry";
      assert(inner_->InsertArtwork(*competing_tx, competing));
      competing_tx->Commit();
      winner_id = competing.id;
      return artscan::db::Result::Err(artscan::db::ErrorCode::Conflict, "duplicate artwork");
    }
    return inner_->InsertArtwork(tx, record);
  }

  int64_t winner_id = 0;

 private:
  bool raced_ = false;
};

// Another writer catalogs a far-away artwork before every insert.
class BusyNeighbourRepository final : public artscan::testing::DelegatingRepository {
 public:
  using DelegatingRepository::DelegatingRepository;

  artscan::db::Result InsertArtwork(artscan::db::Transaction& tx, artscan::db::model::ArtworkRecord& record) override {
    auto neighbour_tx      = inner_->Begin();
    auto neighbour         = record;
    neighbour.title        = "Neighbour";
    neighbour.embedding    = artscan::testing::Axis(kDim, 7);
    assert(inner_->InsertArtwork(*neighbour_tx, neighbour));
    neighbour_tx->Commit();
    ++neighbours;
    return inner_->InsertArtwork(tx, record);
  }

  int neighbours = 0;
};

class AlwaysConflictingRepository final : public artscan::testing::DelegatingRepository {
 public:
  using DelegatingRepository::DelegatingRepository;

  artscan::db::Result InsertArtwork(artscan::db::Transaction&, artscan::db::model::ArtworkRecord&) override {
    ++inserts;
    return artscan::db::Result::Err(artscan::db::ErrorCode::Conflict, "serialization failure");
  }

  int inserts = 0;
};

class RejectingRepository final : public artscan::testing::DelegatingRepository {
 public:
  using DelegatingRepository::DelegatingRepository;

  artscan::db::Result LockCatalogForInsert(artscan::db::Transaction&) override {
    return artscan::db::Result::Err(artscan::db::ErrorCode::ConstraintViolation, "lock refused");
  }
};

void TestCreatesUnverifiedAiArtwork() {
  auto repo        = std::make_shared<MemoryRepository>(kDim);
  auto coordinator = MakeCoordinator(repo);

  auto request       = Request(artscan::testing::Axis(kDim, 0));
  request.confidence = 1.4;
  const auto outcome = coordinator->GetOrCreate(request);

  assert(outcome.created);
  assert(outcome.artwork.id > 0);
  assert(outcome.artwork.source == artscan::v1::ARTWORK_SOURCE_AI_GENERATED);
  assert(!outcome.artwork.is_verified);
  assert(outcome.artwork.confidence_score.has_value());
  assert(*outcome.artwork.confidence_score == 1.0);
  assert(!outcome.artwork.museum_id.has_value());
  assert(CountArtworks(*repo) == 1);
}

void TestSingleMuseumScopeAttachesMuseum() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  {
    auto                             tx = repo->Begin();
    artscan::db::model::MuseumRecord museum;
    museum.name = "Harbour Museum";
    assert(repo->InsertMuseum(*tx, museum));
    tx->Commit();
  }
  auto coordinator = MakeCoordinator(repo);

  auto request       = Request(artscan::testing::Axis(kDim, 1));
  request.scope      = {1};
  const auto outcome = coordinator->GetOrCreate(request);
  assert(outcome.created);
  assert(outcome.artwork.museum_id == std::optional<int64_t>(1));
}

void TestNearbyEmbeddingReturnsExisting() {
  auto repo        = std::make_shared<MemoryRepository>(kDim);
  auto coordinator = MakeCoordinator(repo);

  const auto first  = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 0)));
  const auto second = coordinator->GetOrCreate(Request(artscan::testing::AtDistance(kDim, 0.05)));

  assert(first.created);
  assert(!second.created);
  assert(second.artwork.id == first.artwork.id);
  assert(CountArtworks(*repo) == 1);
}

void TestConcurrentRequestsCreateOnce() {
  auto repo        = std::make_shared<MemoryRepository>(kDim);
  auto coordinator = MakeCoordinator(repo);

  constexpr int              kThreads = 8;
  std::vector<CatalogOutcome> outcomes(kThreads);
  std::vector<std::thread>    threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { outcomes[i] = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 2))); });
  }
  for (auto& t : threads) t.join();

  int               created = 0;
  std::set<int64_t> ids;
  for (const auto& outcome : outcomes) {
    created += outcome.created ? 1 : 0;
    ids.insert(outcome.artwork.id);
  }
  assert(created == 1);
  assert(ids.size() == 1);
  assert(CountArtworks(*repo) == 1);
}

void TestRacingCoordinatorsResolveToOneArtwork() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  auto a    = MakeCoordinator(repo);
  auto b    = MakeCoordinator(repo);

  CatalogOutcome first;
  CatalogOutcome second;
  std::thread    ta([&] { first = a->GetOrCreate(Request(artscan::testing::Axis(kDim, 3))); });
  std::thread    tb([&] { second = b->GetOrCreate(Request(artscan::testing::Axis(kDim, 3))); });
  ta.join();
  tb.join();

  assert(first.artwork.id == second.artwork.id);
  assert(first.created != second.created);
  assert(CountArtworks(*repo) == 1);
}

void TestConflictResolvesToWinner() {
  auto inner       = std::make_shared<MemoryRepository>(kDim);
  auto racing      = std::make_shared<RacingRepository>(inner);
  auto coordinator = MakeCoordinator(racing);

  const auto outcome = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 4)));

  assert(!outcome.created);
  assert(outcome.artwork.id == racing->winner_id);
  assert(outcome.artwork.title == "Competing entry");
  assert(CountArtworks(*inner) == 1);
}

void TestUnrelatedCommitsDoNotAbortInsert() {
  auto inner       = std::make_shared<MemoryRepository>(kDim);
  auto neighbours  = std::make_shared<BusyNeighbourRepository>(inner);
  auto coordinator = MakeCoordinator(neighbours);

  const auto outcome = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 0)));

  assert(outcome.created);
  assert(neighbours->neighbours == 1);
  assert(CountArtworks(*inner) == 2);
}

void TestExhaustedConflictsAreRetryable() {
  auto inner       = std::make_shared<MemoryRepository>(kDim);
  auto conflicting = std::make_shared<AlwaysConflictingRepository>(inner);
  auto coordinator = MakeCoordinator(conflicting);

  bool busy = false;
  try {
    coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 1)));
  } catch (const artscan::util::StoreBusy& e) {
    busy = true;
    assert(artscan::grpc::ToStatus(e).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  }
  assert(busy);
  assert(conflicting->inserts == static_cast<int>(Settings().max_catalog_attempts));
  assert(CountArtworks(*inner) == 0);
}

void TestStoreRejectionIsInternal() {
  auto inner       = std::make_shared<MemoryRepository>(kDim);
  auto coordinator = MakeCoordinator(std::make_shared<RejectingRepository>(inner));

  bool rejected = false;
  try {
    coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 2)));
  } catch (const artscan::util::InvalidArgument&) {
    assert(false);
  } catch (const std::runtime_error& e) {
    rejected = true;
    assert(artscan::grpc::ToStatus(e).error_code() == ::grpc::StatusCode::INTERNAL);
  }
  assert(rejected);
  assert(CountArtworks(*inner) == 0);
}

void TestDistantEmbeddingsCreateSeparateArtworks() {
  auto repo        = std::make_shared<MemoryRepository>(kDim);
  auto coordinator = MakeCoordinator(repo);

  const auto a = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 5)));
  const auto b = coordinator->GetOrCreate(Request(artscan::testing::Axis(kDim, 6)));
  assert(a.created && b.created);
  assert(a.artwork.id != b.artwork.id);
  assert(CountArtworks(*repo) == 2);
}

} // namespace

int main() {
  TestCreatesUnverifiedAiArtwork();
  TestSingleMuseumScopeAttachesMuseum();
  TestNearbyEmbeddingReturnsExisting();
  TestConcurrentRequestsCreateOnce();
  TestRacingCoordinatorsResolveToOneArtwork();
  TestConflictResolvesToWinner();
  TestUnrelatedCommitsDoNotAbortInsert();
  TestExhaustedConflictsAreRetryable();
  TestStoreRejectionIsInternal();
  TestDistantEmbeddingsCreateSeparateArtworks();

  std::cout << "artscan_unit_auto_catalog_coordinator: pass\n";
  return 0;
}
