#include "scan_ledger.hpp"

#include <algorithm>
#include <string>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace artscan::ledger {

ScanLedger::ScanLedger(std::shared_ptr<db::Repository> repository, MillisClock clock)
    : repository_(std::move(repository)), clock_(clock ? std::move(clock) : MillisClock(&util::NowMillis)) {
}

db::model::ScanRecord ScanLedger::Record(const std::string& user_id, std::optional<int64_t> artwork_id, const std::string& image_url,
                                         model::ScanStatus status) {
  if (user_id.empty()) {
    throw util::InvalidArgument("scan user_id is required");
  }

  for (int attempt = 1;; ++attempt) {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->LockScansForUser(*tx, user_id), "lock scan ledger");

    db::model::ScanRecord record;
    record.user_id    = user_id;
    record.artwork_id = artwork_id;
    record.image_url  = image_url;
    record.status     = status;

    record.timestamp_ms = clock_();
    if (auto latest = repository_->LatestScanTimestamp(*tx, user_id); latest && *latest >= record.timestamp_ms) {
      record.timestamp_ms = *latest + 1;
    }

    try {
      db::ThrowIfDbError(repository_->InsertScan(*tx, record), "record scan");
      tx->Commit();
      return record;
    } catch (const util::StoreConflict& e) {
      if (attempt >= kMaxAttempts) {
        throw util::StoreBusy("scan ledger still conflicting after " + std::to_string(attempt) + " attempts: " + e.what());
      }
      ARTSCAN_LOG_DEBUG("scan ledger commit conflicted, retrying", {observability::IntField("attempt", attempt)});
    }
  }
}

std::vector<db::model::ScanRecord> ScanLedger::List(const std::string& user_id, const db::Pagination& pagination) const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListScans(*tx, user_id, pagination);
  tx->Commit();
  return rows;
}

} // namespace artscan::ledger
