#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artscan::db::memory {

class MemoryTransaction;

/*
  In-process catalog store.

  Transactions read a private snapshot and replay their writes onto the
  committed state at Commit(). Only rows a transaction updated or deleted
  are validated: if another transaction changed one of them first, the
  commit throws util::StoreConflict. Inserts never conflict; creation
  races are excluded by LockCatalogForInsert and LockScansForUser, which
  hold a repository mutex until the transaction ends.
*/
class MemoryRepository final : public db::Repository {
public:
  // embedding_dimension 0 accepts any dimension
  explicit MemoryRepository(std::size_t embedding_dimension = 0);

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
  friend class MemoryTransaction;

  enum Table : std::size_t { kMuseums = 0, kArtworks, kScans, kIssues, kTableCount };

  static constexpr std::size_t kScanLockStripes = 16;

  struct State {
    std::map<int64_t, model::MuseumRecord>  museums;
    std::map<int64_t, model::ArtworkRecord> artworks;
    std::vector<model::ScanRecord>          scans;
    std::map<int64_t, model::IssueRecord>   issues;

    // commit sequence that last wrote each row
    std::array<std::map<int64_t, uint64_t>, kTableCount> row_versions;
  };

  int64_t NextId(Table table);

  std::mutex                                   mutex_;
  State                                        committed_;
  uint64_t                                     commit_seq_ = 0;
  std::array<int64_t, kTableCount>             next_ids_{1, 1, 1, 1};
  std::mutex                                   catalog_mutex_;
  std::array<std::mutex, kScanLockStripes>     scan_user_mutexes_;
  std::size_t                                  embedding_dimension_;
};

}
