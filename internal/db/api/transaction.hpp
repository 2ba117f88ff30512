#pragma once

namespace artscan::db {

/*
  One unit of work against the catalog store.

  Writes stay invisible to other transactions until Commit(). Destroying
  an uncommitted transaction rolls it back. Commit() throws
  util::StoreConflict when a concurrent writer changed the same rows
  first; the caller re-reads and decides again.

  sqlite serialises writers with BEGIN IMMEDIATE. postgres runs a
  READ COMMITTED pqxx::work with advisory locks. The memory store
  validates the rows it updated or deleted at commit.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace artscan::db
