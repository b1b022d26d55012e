#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"

namespace netmap::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() reports contention as Busy/Conflict instead of throwing,
    so callers can retry the batch
  - Commit hooks run after a successful commit and before any transaction
    begun later can observe its writes

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy + per-key validation at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual Result Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  // in-process state that must move in step with the store
  void OnCommit(std::function<void()> hook) {
    hooks_.push_back(std::move(hook));
  }

protected:
  void RunCommitHooks() {
    for (auto& hook : hooks_) {
      hook();
    }
    hooks_.clear();
  }

private:
  std::vector<std::function<void()>> hooks_;
};

}
