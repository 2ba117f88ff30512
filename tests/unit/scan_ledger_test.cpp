#include "internal/ledger/scan_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/delegating_repository.hpp"

namespace {

using artscan::db::memory::MemoryRepository;
using artscan::ledger::ScanLedger;

ScanLedger::MillisClock FrozenClock(uint64_t now_ms) {
  return [now_ms] { return now_ms; };
}

// Reports the first `conflicts` inserts as duplicate (user_id, timestamp_ms).
class ConflictingScans final : public artscan::testing::DelegatingRepository {
 public:
  ConflictingScans(std::shared_ptr<artscan::db::Repository> inner, int conflicts)
      : DelegatingRepository(std::move(inner)), remaining_(conflicts) {
  }

  artscan::db::Result LockScansForUser(artscan::db::Transaction& tx, const std::string& user_id) override {
    ++locks;
    return inner_->LockScansForUser(tx, user_id);
  }

  artscan::db::Result InsertScan(artscan::db::Transaction& tx, artscan::db::model::ScanRecord& record) override {
    if (remaining_ > 0) {
      --remaining_;
      return artscan::db::Result::Err(artscan::db::ErrorCode::Conflict, "duplicate key value violates unique constraint");
    }
    return inner_->InsertScan(tx, record);
  }

  int locks = 0;

 private:
  int remaining_;
};

void TestTimestampsStrictlyIncreaseWhenClockStalls() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo, FrozenClock(1'000));

  const auto a = ledger.Record("visitor-1", std::nullopt, "memory://images/1", artscan::v1::SCAN_STATUS_NOT_ART);
  const auto b = ledger.Record("visitor-1", 7, "memory://images/2", artscan::v1::SCAN_STATUS_COMMUNITY_RESULT);
  const auto c = ledger.Record("visitor-1", 7, "memory://images/3", artscan::v1::SCAN_STATUS_COMMUNITY_RESULT);

  assert(a.timestamp_ms == 1'000);
  assert(b.timestamp_ms == 1'001);
  assert(c.timestamp_ms == 1'002);
  assert(a.id != b.id && b.id != c.id);
}

void TestUsersHaveIndependentTimelines() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo, FrozenClock(5'000));

  ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  const auto other = ledger.Record("visitor-2", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  assert(other.timestamp_ms == 5'000);
}

void TestClockAheadIsUsedAsIs() {
  auto       repo = std::make_shared<MemoryRepository>();
  uint64_t   now  = 100;
  ScanLedger ledger(repo, [&now] { return now; });

  ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  now             = 900;
  const auto next = ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  assert(next.timestamp_ms == 900);
}

void TestEmptyUserIsRejected() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo);

  bool threw = false;
  try {
    ledger.Record("", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  } catch (const artscan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestListIsNewestFirstAndPaged() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo, FrozenClock(42));

  for (int i = 0; i < 5; ++i) {
    ledger.Record("visitor-1", std::nullopt, "memory://images/" + std::to_string(i), artscan::v1::SCAN_STATUS_NOT_ART);
  }
  ledger.Record("visitor-2", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);

  const auto all = ledger.List("visitor-1", artscan::db::Pagination{0, 0});
  assert(all.size() == 5);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].timestamp_ms > all[i].timestamp_ms);
  }
  assert(all.front().image_url == "memory://images/4");

  const auto page = ledger.List("visitor-1", artscan::db::Pagination{2, 1});
  assert(page.size() == 2);
  assert(page[0].id == all[1].id);
  assert(page[1].id == all[2].id);
}

void TestConcurrentRecordsKeepDistinctTimestamps() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo, FrozenClock(10));

  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&] { ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART); });
  }
  for (auto& t : threads) t.join();

  const auto rows = ledger.List("visitor-1", artscan::db::Pagination{0, 0});
  assert(rows.size() == 2);
  assert(rows[0].timestamp_ms == 11);
  assert(rows[1].timestamp_ms == 10);
}

void TestManyWritersForOneUserAllLand() {
  auto       repo = std::make_shared<MemoryRepository>();
  ScanLedger ledger(repo, FrozenClock(10));

  constexpr int            kWriters = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&] { ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART); });
  }
  for (auto& t : threads) t.join();

  const auto rows = ledger.List("visitor-1", artscan::db::Pagination{0, 0});
  assert(rows.size() == kWriters);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].timestamp_ms == 10 + kWriters - 1 - i);
  }
}

void TestInsertConflictIsRetried() {
  auto       repo = std::make_shared<ConflictingScans>(std::make_shared<MemoryRepository>(), 2);
  ScanLedger ledger(repo, FrozenClock(10));

  const auto record = ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  assert(record.id > 0);
  assert(repo->locks == 3);
  assert(ledger.List("visitor-1", artscan::db::Pagination{0, 0}).size() == 1);
}

void TestExhaustedConflictsRaiseStoreBusy() {
  auto       repo = std::make_shared<ConflictingScans>(std::make_shared<MemoryRepository>(), ScanLedger::kMaxAttempts);
  ScanLedger ledger(repo, FrozenClock(10));

  bool busy = false;
  try {
    ledger.Record("visitor-1", std::nullopt, "", artscan::v1::SCAN_STATUS_NOT_ART);
  } catch (const artscan::util::StoreBusy&) {
    busy = true;
  }
  assert(busy);
  assert(repo->locks == ScanLedger::kMaxAttempts);
  assert(ledger.List("visitor-1", artscan::db::Pagination{0, 0}).empty());
}

} // namespace

int main() {
  TestTimestampsStrictlyIncreaseWhenClockStalls();
  TestUsersHaveIndependentTimelines();
  TestClockAheadIsUsedAsIs();
  TestEmptyUserIsRejected();
  TestListIsNewestFirstAndPaged();
  TestConcurrentRecordsKeepDistinctTimestamps();
  TestManyWritersForOneUserAllLand();
  TestInsertConflictIsRetried();
  TestExhaustedConflictsRaiseStoreBusy();

  std::cout << "artscan_unit_scan_ledger: pass\n";
  return 0;
}
