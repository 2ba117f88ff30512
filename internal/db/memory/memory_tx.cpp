#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace artscan::db::memory {

bool MemoryTransaction::RowExists(const State& state, std::size_t table, int64_t id) {
  switch (table) {
    case MemoryRepository::kMuseums:
      return state.museums.contains(id);
    case MemoryRepository::kArtworks:
      return state.artworks.contains(id);
    case MemoryRepository::kIssues:
      return state.issues.contains(id);
    default:
      return false;
  }
}

uint64_t MemoryTransaction::RowVersion(const State& state, std::size_t table, int64_t id) {
  const auto& versions = state.row_versions[table];
  auto        it       = versions.find(id);
  return it == versions.end() ? 0 : it->second;
}

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  Finish();
}

void MemoryTransaction::Apply(Write write) {
  write(working_);
  writes_.push_back(std::move(write));
}

void MemoryTransaction::Touch(MemoryRepository::Table table, int64_t id) {
  touched_.emplace(std::make_pair(static_cast<std::size_t>(table), id), RowVersion(working_, table, id));
}

void MemoryTransaction::HoldUntilEnd(std::mutex& mutex) {
  for (const auto& lock : held_) {
    if (lock.mutex() == &mutex) return;
  }
  held_.emplace_back(mutex);
  Refresh();
}

void MemoryTransaction::Refresh() {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
  for (const auto& write : writes_) {
    write(working_);
  }
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("memory transaction already finished");
  }

  {
    std::scoped_lock lock(repo_.mutex_);
    auto&            target = repo_.committed_;
    for (const auto& [row, seen] : touched_) {
      if (RowVersion(target, row.first, row.second) != seen) {
        Finish();
        throw util::StoreConflict("transaction conflict: row " + std::to_string(row.second) + " was modified by a concurrent transaction");
      }
    }

    for (const auto& write : writes_) {
      write(target);
    }

    const auto seq = ++repo_.commit_seq_;
    for (const auto& [row, seen] : touched_) {
      auto& versions = target.row_versions[row.first];
      if (RowExists(target, row.first, row.second)) {
        versions[row.second] = seq;
      } else {
        versions.erase(row.second);
      }
    }
  }

  committed_ = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  Finish();
}

void MemoryTransaction::Finish() {
  finished_ = true;
  writes_.clear();
  held_.clear();
}

} // namespace artscan::db::memory
