#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artwork_record.hpp"
#include "internal/db/model/issue_record.hpp"
#include "internal/db/model/museum_record.hpp"
#include "internal/db/model/scan_record.hpp"

namespace artscan::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Ids are assigned by the store on insert
  - Artwork rows are validated on write: embedding dimension,
    confidence in [0,1], source/verification consistency

  The DB is the source of truth for:
    artwork existence
    scan history
    moderation state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Museums
  // ---------------------------------------------------------------------

  virtual Result InsertMuseum(Transaction&, model::MuseumRecord&) = 0;

  virtual std::optional<model::MuseumRecord> GetMuseum(Transaction&, int64_t id) = 0;

  virtual std::vector<model::MuseumRecord> ListMuseums(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Artworks
  // ---------------------------------------------------------------------

  virtual Result InsertArtwork(Transaction&, model::ArtworkRecord&) = 0;

  virtual std::optional<model::ArtworkRecord> GetArtwork(Transaction&, int64_t id) = 0;

  virtual Result UpdateArtwork(Transaction&, const model::ArtworkRecord&) = 0;

  // Scan events referencing the artwork keep their row with a null artwork id.
  virtual Result DeleteArtwork(Transaction&, int64_t id) = 0;

  virtual std::size_t CountArtworks(Transaction&) = 0;

  // Nearest neighbours by cosine distance ascending. Candidates are the
  // unaffiliated artworks plus those owned by a museum in museum_scope.
  virtual std::vector<model::ArtworkCandidate> NearestArtworks(Transaction&, const std::vector<float>& embedding,
                                                               const std::vector<int64_t>& museum_scope, std::size_t limit) = 0;

  // Serializes artwork creation with every other transaction that takes
  // this lock, until the transaction ends.
  virtual Result LockCatalogForInsert(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Scan ledger
  // ---------------------------------------------------------------------

  // Serializes ledger writes for one user until the transaction ends, so
  // LatestScanTimestamp followed by InsertScan cannot interleave.
  virtual Result LockScansForUser(Transaction&, const std::string& user_id) = 0;

  virtual Result InsertScan(Transaction&, model::ScanRecord&) = 0;

  virtual std::optional<uint64_t> LatestScanTimestamp(Transaction&, const std::string& user_id) = 0;

  // Newest first.
  virtual std::vector<model::ScanRecord> ListScans(Transaction&, const std::string& user_id, const Pagination& pagination) = 0;

  // ---------------------------------------------------------------------
  // Issue reports
  // ---------------------------------------------------------------------

  virtual Result InsertIssue(Transaction&, model::IssueRecord&) = 0;

  virtual std::optional<model::IssueRecord> GetIssue(Transaction&, int64_t id) = 0;

  virtual Result UpdateIssue(Transaction&, const model::IssueRecord&) = 0;

  // Oldest first; all states when state is empty.
  virtual std::vector<model::IssueRecord> ListIssues(Transaction&, std::optional<model::IssueState> state, const Pagination& pagination) = 0;
};

} // namespace artscan::db
