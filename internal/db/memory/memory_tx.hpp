#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace woki::db::memory {

/*
  Transaction = snapshot + write set

  Commit is optimistic: a transaction that wrote anything fails with
  TransactionConflict when any other transaction committed after this one
  took its snapshot. Read-only transactions (availability loads) commit
  without publishing a new version.
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
    wrote_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    wrote_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace woki::db::memory
