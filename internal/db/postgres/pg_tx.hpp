#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace artscan::db::postgres {

// Holds a pooled connection for its whole lifetime. A serialization
// failure at commit surfaces as util::StoreConflict.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kAborted };

  std::shared_ptr<pqxx::connection> connection_;
  std::unique_ptr<pqxx::work>       work_;
  State                             state_ = State::kOpen;
};

} // namespace artscan::db::postgres
