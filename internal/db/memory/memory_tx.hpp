#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace airtime::db::memory {

/*
  Transaction = snapshot + write set

  Commit publishes only the rows this transaction touched, so transactions
  working on different channels never conflict. A file_path claimed by
  another committed row fails the commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void TouchSegment(int64_t id) {
    writes_.segments.insert(id);
  }
  void TouchEditLog(int64_t id) {
    writes_.edit_logs.insert(id);
  }

 private:
  MemoryRepository&          repo_;
  MemoryRepository::State    working_;
  MemoryRepository::WriteSet writes_;
  bool                       committed_   = false;
  bool                       rolled_back_ = false;
};

} // namespace airtime::db::memory
