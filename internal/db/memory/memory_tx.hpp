#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace artscan::db::memory {

/*
  Transaction = snapshot + replayable write log

  Every write is applied to the private snapshot immediately and replayed
  onto the committed state at Commit(). Rows passed to Touch() are the
  conflict set.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  using State = MemoryRepository::State;
  using Write = std::function<void(State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const State& View() const {
    return working_;
  }

  void Apply(Write write);

  // Commit fails if the row changed since this transaction first saw it.
  void Touch(MemoryRepository::Table table, int64_t id);

  // Locks mutex until the transaction ends, then re-reads committed state
  // so the caller sees every write made by the previous holder.
  void HoldUntilEnd(std::mutex& mutex);

 private:
  static bool     RowExists(const State& state, std::size_t table, int64_t id);
  static uint64_t RowVersion(const State& state, std::size_t table, int64_t id);

  void Refresh();
  void Finish();

  MemoryRepository&                                  repo_;
  State                                              working_;
  std::vector<Write>                                 writes_;
  std::map<std::pair<std::size_t, int64_t>, uint64_t> touched_;
  std::vector<std::unique_lock<std::mutex>>          held_;
  bool                                               committed_ = false;
  bool                                               finished_  = false;
};

} // namespace artscan::db::memory
