#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace artscan::ledger {

/*
  ScanLedger

  Append-only record of completed scans. Timestamps are strictly
  increasing per user: when the clock has not advanced past the user's
  latest event the new event gets latest + 1 ms. Writers for one user are
  serialized by Repository::LockScansForUser.
*/
class ScanLedger {
 public:
  using MillisClock = std::function<uint64_t()>;

  static constexpr int kMaxAttempts = 5;

  explicit ScanLedger(std::shared_ptr<db::Repository> repository, MillisClock clock = {});

  db::model::ScanRecord Record(const std::string& user_id, std::optional<int64_t> artwork_id, const std::string& image_url,
                               model::ScanStatus status);

  std::vector<db::model::ScanRecord> List(const std::string& user_id, const db::Pagination& pagination) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  MillisClock                     clock_;
};

} // namespace artscan::ledger
