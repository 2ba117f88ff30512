#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace artscan::db::postgres {

/*
  Postgres catalog store.

  Embeddings live in a pgvector column and nearest-neighbour search uses
  the cosine distance operator (<=>). Artwork creation is serialized with
  a transaction-scoped advisory lock.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool, std::size_t embedding_dimension = 0);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMuseum(Transaction&, model::MuseumRecord&) override;
  std::optional<model::MuseumRecord> GetMuseum(Transaction&, int64_t id) override;
  std::vector<model::MuseumRecord> ListMuseums(Transaction&) override;

  Result InsertArtwork(Transaction&, model::ArtworkRecord&) override;
  std::optional<model::ArtworkRecord> GetArtwork(Transaction&, int64_t id) override;
  Result UpdateArtwork(Transaction&, const model::ArtworkRecord&) override;
  Result DeleteArtwork(Transaction&, int64_t id) override;
  std::size_t CountArtworks(Transaction&) override;
  std::vector<model::ArtworkCandidate> NearestArtworks(Transaction&, const std::vector<float>& embedding,
                                                       const std::vector<int64_t>& museum_scope, std::size_t limit) override;
  Result LockCatalogForInsert(Transaction&) override;

  Result LockScansForUser(Transaction&, const std::string& user_id) override;
  Result InsertScan(Transaction&, model::ScanRecord&) override;
  std::optional<uint64_t> LatestScanTimestamp(Transaction&, const std::string& user_id) override;
  std::vector<model::ScanRecord> ListScans(Transaction&, const std::string& user_id, const Pagination& pagination) override;

  Result InsertIssue(Transaction&, model::IssueRecord&) override;
  std::optional<model::IssueRecord> GetIssue(Transaction&, int64_t id) override;
  Result UpdateIssue(Transaction&, const model::IssueRecord&) override;
  std::vector<model::IssueRecord> ListIssues(Transaction&, std::optional<model::IssueState> state,
                                             const Pagination& pagination) override;

private:
  std::shared_ptr<PgPool> pool_;
  std::size_t             embedding_dimension_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
