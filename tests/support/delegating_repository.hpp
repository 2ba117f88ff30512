#pragma once

#include <memory>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace artscan::testing {

// Forwards every call to an inner repository; tests override the calls
// they want to intercept.
class DelegatingRepository : public db::Repository {
 public:
  explicit DelegatingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertMuseum(db::Transaction& tx, db::model::MuseumRecord& r) override {
    return inner_->InsertMuseum(tx, r);
  }
  std::optional<db::model::MuseumRecord> GetMuseum(db::Transaction& tx, int64_t id) override {
    return inner_->GetMuseum(tx, id);
  }
  std::vector<db::model::MuseumRecord> ListMuseums(db::Transaction& tx) override {
    return inner_->ListMuseums(tx);
  }

  db::Result InsertArtwork(db::Transaction& tx, db::model::ArtworkRecord& r) override {
    return inner_->InsertArtwork(tx, r);
  }
  std::optional<db::model::ArtworkRecord> GetArtwork(db::Transaction& tx, int64_t id) override {
    return inner_->GetArtwork(tx, id);
  }
  db::Result UpdateArtwork(db::Transaction& tx, const db::model::ArtworkRecord& r) override {
    return inner_->UpdateArtwork(tx, r);
  }
  db::Result DeleteArtwork(db::Transaction& tx, int64_t id) override {
    return inner_->DeleteArtwork(tx, id);
  }
  std::size_t CountArtworks(db::Transaction& tx) override {
    return inner_->CountArtworks(tx);
  }
  std::vector<db::model::ArtworkCandidate> NearestArtworks(db::Transaction& tx, const std::vector<float>& embedding,
                                                           const std::vector<int64_t>& museum_scope, std::size_t limit) override {
    return inner_->NearestArtworks(tx, embedding, museum_scope, limit);
  }
  db::Result LockCatalogForInsert(db::Transaction& tx) override {
    return inner_->LockCatalogForInsert(tx);
  }

  db::Result LockScansForUser(db::Transaction& tx, const std::string& user_id) override {
    return inner_->LockScansForUser(tx, user_id);
  }
  db::Result InsertScan(db::Transaction& tx, db::model::ScanRecord& r) override {
    return inner_->InsertScan(tx, r);
  }
  std::optional<uint64_t> LatestScanTimestamp(db::Transaction& tx, const std::string& user_id) override {
    return inner_->LatestScanTimestamp(tx, user_id);
  }
  std::vector<db::model::ScanRecord> ListScans(db::Transaction& tx, const std::string& user_id, const db::Pagination& pagination) override {
    return inner_->ListScans(tx, user_id, pagination);
  }

  db::Result InsertIssue(db::Transaction& tx, db::model::IssueRecord& r) override {
    return inner_->InsertIssue(tx, r);
  }
  std::optional<db::model::IssueRecord> GetIssue(db::Transaction& tx, int64_t id) override {
    return inner_->GetIssue(tx, id);
  }
  db::Result UpdateIssue(db::Transaction& tx, const db::model::IssueRecord& r) override {
    return inner_->UpdateIssue(tx, r);
  }
  std::vector<db::model::IssueRecord> ListIssues(db::Transaction& tx, std::optional<db::model::IssueState> state,
                                                 const db::Pagination& pagination) override {
    return inner_->ListIssues(tx, state, pagination);
  }

 protected:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace artscan::testing
