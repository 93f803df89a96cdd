#include "memory_tx.hpp"

#include <stdexcept>

namespace airtime::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);

  for (const auto id : writes_.segments) {
    const auto& row = working_.segments.at(id);
    if (row.file_path.empty()) continue;
    for (const auto& [other_id, other] : repo_.committed_.segments) {
      if (other_id != id && !writes_.segments.contains(other_id) && other.file_path == row.file_path) {
        throw std::runtime_error("transaction conflict: file_path already committed: " + row.file_path);
      }
    }
  }

  for (const auto id : writes_.segments) {
    repo_.committed_.segments[id] = working_.segments.at(id);
  }
  for (const auto id : writes_.edit_logs) {
    repo_.committed_.edit_logs[id] = working_.edit_logs.at(id);
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  writes_      = {};
}

} // namespace airtime::db::memory
