#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace artscan::db::sqlite {

/*
  Owns the catalog's single sqlite3 connection.

  Every transaction of the process shares it, so a transaction holds
  TxMutex() from BEGIN to COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements that produce no rows.
  void Exec(const std::string& sql);

 private:
  void ApplyPragmas();

  std::string path_;
  sqlite3*    db_ = nullptr;
  std::mutex  tx_mutex_;
};

} // namespace artscan::db::sqlite
