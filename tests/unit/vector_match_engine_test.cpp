#include "internal/recognition/vector_match_engine.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/support/embeddings.hpp"

namespace {

using artscan::db::memory::MemoryRepository;
using artscan::recognition::VectorMatchEngine;
using artscan::testing::AtDistance;
using artscan::testing::Axis;

constexpr std::size_t kDim = 8;

artscan::config::RecognitionSettings Settings() {
  artscan::config::RecognitionSettings settings;
  settings.embedding_dimension = kDim;
  return settings;
}

int64_t AddMuseum(artscan::db::Repository& repo) {
  auto                             tx = repo.Begin();
  artscan::db::model::MuseumRecord museum;
  museum.name = "museum";
  assert(repo.InsertMuseum(*tx, museum));
  tx->Commit();
  return museum.id;
}

int64_t AddArtwork(artscan::db::Repository& repo, const std::vector<float>& embedding, std::optional<int64_t> museum_id,
                   artscan::model::ArtworkSource source, bool verified) {
  auto                              tx = repo.Begin();
  artscan::db::model::ArtworkRecord artwork;
  artwork.title       = "artwork";
  artwork.embedding   = embedding;
  artwork.museum_id   = museum_id;
  artwork.source      = source;
  artwork.is_verified = verified;
  assert(repo.InsertArtwork(*tx, artwork));
  tx->Commit();
  return artwork.id;
}

void TestMatchWithinThreshold() {
  auto       repo = std::make_shared<MemoryRepository>(kDim);
  const auto id   = AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_ADMIN, true);

  VectorMatchEngine engine(repo, Settings());
  const auto        match = engine.Match(AtDistance(kDim, 0.1), {});
  assert(match.has_value());
  assert(match->artwork.id == id);
  assert(match->tier == artscan::v1::MATCH_TIER_VERIFIED);
  assert(std::abs(match->distance - 0.1) < 1e-5);
}

void TestNoMatchAtOrBeyondThreshold() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_ADMIN, true);

  VectorMatchEngine engine(repo, Settings());
  assert(!engine.Match(AtDistance(kDim, 0.2), {}).has_value());
  assert(!engine.Match(Axis(kDim, 3), {}).has_value());
}

void TestEmptyStoreHasNoMatch() {
  VectorMatchEngine engine(std::make_shared<MemoryRepository>(kDim), Settings());
  assert(!engine.Match(Axis(kDim, 0), {}).has_value());
}

void TestScopeExcludesOtherMuseums() {
  auto       repo      = std::make_shared<MemoryRepository>(kDim);
  const auto museum_id = AddMuseum(*repo);
  const auto other_id  = AddMuseum(*repo);
  const auto scoped    = AddArtwork(*repo, Axis(kDim, 0), museum_id, artscan::v1::ARTWORK_SOURCE_MUSEUM_API, true);

  VectorMatchEngine engine(repo, Settings());
  assert(!engine.Match(Axis(kDim, 0), {}).has_value());
  assert(!engine.Match(Axis(kDim, 0), {other_id}).has_value());

  const auto match = engine.Match(Axis(kDim, 0), {museum_id});
  assert(match.has_value());
  assert(match->artwork.id == scoped);
}

void TestUnaffiliatedArtworksAlwaysInScope() {
  auto       repo      = std::make_shared<MemoryRepository>(kDim);
  const auto museum_id = AddMuseum(*repo);
  const auto community = AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_AI_GENERATED, false);

  VectorMatchEngine engine(repo, Settings());
  const auto        match = engine.Match(Axis(kDim, 0), {museum_id});
  assert(match.has_value());
  assert(match->artwork.id == community);
  assert(match->tier == artscan::v1::MATCH_TIER_COMMUNITY);
}

void TestClosestCandidateWins() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  AddArtwork(*repo, AtDistance(kDim, 0.1, 2), std::nullopt, artscan::v1::ARTWORK_SOURCE_ADMIN, true);
  const auto closer = AddArtwork(*repo, AtDistance(kDim, 0.01, 3), std::nullopt, artscan::v1::ARTWORK_SOURCE_AI_GENERATED, false);

  VectorMatchEngine engine(repo, Settings());
  const auto        match = engine.Match(Axis(kDim, 0), {});
  assert(match.has_value());
  assert(match->artwork.id == closer);
}

void TestVerifiedWinsExactTie() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_AI_GENERATED, false);
  const auto verified = AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_MUSEUM_API, true);

  VectorMatchEngine engine(repo, Settings());
  const auto        match = engine.Match(Axis(kDim, 0), {});
  assert(match.has_value());
  assert(match->artwork.id == verified);
}

void TestConfiguredThresholdApplies() {
  auto repo = std::make_shared<MemoryRepository>(kDim);
  AddArtwork(*repo, Axis(kDim, 0), std::nullopt, artscan::v1::ARTWORK_SOURCE_ADMIN, true);

  auto settings               = Settings();
  settings.distance_threshold = 0.3;
  VectorMatchEngine engine(repo, settings);
  assert(engine.Threshold() == 0.3);
  assert(engine.Match(AtDistance(kDim, 0.2), {}).has_value());
}

void TestMatchInsideCallerTransactionSeesUncommittedInsert() {
  auto repo = std::make_shared<MemoryRepository>(kDim);

  VectorMatchEngine engine(repo, Settings());
  auto              tx = repo->Begin();

  artscan::db::model::ArtworkRecord artwork;
  artwork.title     = "pending";
  artwork.embedding = Axis(kDim, 0);
  assert(repo->InsertArtwork(*tx, artwork));

  assert(engine.Match(*tx, Axis(kDim, 0), {}).has_value());
  assert(!engine.Match(Axis(kDim, 0), {}).has_value());
  tx->Rollback();
}

} // namespace

int main() {
  TestMatchWithinThreshold();
  TestNoMatchAtOrBeyondThreshold();
  TestEmptyStoreHasNoMatch();
  TestScopeExcludesOtherMuseums();
  TestUnaffiliatedArtworksAlwaysInScope();
  TestClosestCandidateWins();
  TestVerifiedWinsExactTie();
  TestConfiguredThresholdApplies();
  TestMatchInsideCallerTransactionSeesUncommittedInsert();

  std::cout << "artscan_unit_vector_match_engine: pass\n";
  return 0;
}
