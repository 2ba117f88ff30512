#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace artscan::db::postgres {

/*
  Bounded set of libpqxx connections for PgRepository.

  A pqxx::connection is not thread-safe, so each PgTransaction checks one
  out for its lifetime. The handle returned by Acquire() gives the
  connection back when the last copy is dropped; if the pool is gone by
  then the connection is closed instead. Catalog statements are prepared
  once per connection when it is opened.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while every connection is checked out.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t capacity_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    opened_ = 0;
};

} // namespace artscan::db::postgres
