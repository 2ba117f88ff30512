#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artscan::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : connection_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*connection_);
}

PgTransaction::~PgTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    work_->abort();
  } catch (const std::exception& e) {
    ARTSCAN_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  // A failed commit leaves nothing to roll back.
  state_ = State::kAborted;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::StoreConflict(std::string("postgres commit: ") + e.what());
  }
  state_ = State::kCommitted;
}

void PgTransaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kAborted;
  work_->abort();
}

} // namespace artscan::db::postgres
