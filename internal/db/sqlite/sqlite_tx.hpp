#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace artscan::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex until commit or rollback and
  uses BEGIN IMMEDIATE so the write lock is taken up front. Writers are
  therefore fully serialized and Commit never reports a conflict.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
