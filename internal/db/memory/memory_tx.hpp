#pragma once

#include <string>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace netmap::db::memory {

/*
  Transaction = snapshot + read set + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  Result Commit() override;
  void   Rollback() override;
  bool   IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void MarkRead(const std::string& key) {
    read_keys_.insert(key);
  }
  void MarkWrite(const std::string& key) {
    write_keys_.insert(key);
  }
  void MarkReset() {
    reset_ = true;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;

  std::unordered_set<std::string> read_keys_;
  std::unordered_set<std::string> write_keys_;

  bool committed_   = false;
  bool rolled_back_ = false;
  bool reset_       = false;
};

} // namespace netmap::db::memory
