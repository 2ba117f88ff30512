#include "sqlite_db.hpp"

#include <stdexcept>

namespace artscan::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

// WAL lets readers proceed during a commit; in-memory databases report "memory" instead.
// scans.artwork_id ON DELETE SET NULL requires foreign_keys.
constexpr const char* kPragmas = "PRAGMA journal_mode=WAL;"
                                 "PRAGMA synchronous=NORMAL;"
                                 "PRAGMA foreign_keys=ON;"
                                 "PRAGMA temp_store=MEMORY;";

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open catalog database " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) == SQLITE_OK) {
    return;
  }
  std::string message = error != nullptr ? error : sqlite3_errmsg(db_);
  sqlite3_free(error);
  throw std::runtime_error("sqlite exec on " + path_ + ": " + message);
}

void SqliteDB::ApplyPragmas() {
  Exec(kPragmas);
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace artscan::db::sqlite
