#include "entity_lock_table.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace netmap::lock {

EntityLockTable::Guard::~Guard() {
  Release();
}

EntityLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_),
      keys_(std::move(other.keys_)),
      held_(std::move(other.held_)),
      shared_(std::move(other.shared_)),
      exclusive_(std::move(other.exclusive_)) {
  other.table_ = nullptr;
  other.keys_.clear();
  other.held_.clear();
}

EntityLockTable::Guard& EntityLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Release();
    table_     = other.table_;
    keys_      = std::move(other.keys_);
    held_      = std::move(other.held_);
    shared_    = std::move(other.shared_);
    exclusive_ = std::move(other.exclusive_);
    other.table_ = nullptr;
    other.keys_.clear();
    other.held_.clear();
  }
  return *this;
}

void EntityLockTable::Guard::Release() {
  for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
    (*it)->unlock();
  }
  held_.clear();
  if (table_ != nullptr) table_->Prune(keys_);
  keys_.clear();
  table_ = nullptr;

  if (shared_.owns_lock()) shared_.unlock();
  if (exclusive_.owns_lock()) exclusive_.unlock();
}

std::shared_ptr<std::timed_mutex> EntityLockTable::MutexFor(const std::string& key) {
  std::lock_guard lock(guard_);
  auto&           mutex = mutexes_[key];
  if (!mutex) {
    mutex = std::make_shared<std::timed_mutex>();
  }
  return mutex;
}

void EntityLockTable::Prune(const std::vector<std::string>& keys) {
  std::lock_guard lock(guard_);
  for (const auto& key : keys) {
    auto it = mutexes_.find(key);
    // copies are only handed out under guard_, so a count of one means idle
    if (it != mutexes_.end() && it->second.use_count() == 1) mutexes_.erase(it);
  }
}

EntityLockTable::Guard EntityLockTable::Acquire(std::vector<std::string> keys, std::chrono::milliseconds timeout) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  Guard guard;
  guard.shared_ = std::shared_lock<std::shared_timed_mutex>(global_, std::defer_lock);
  if (!guard.shared_.try_lock_until(deadline)) {
    throw util::StoreTransactionError("lock table: timed out waiting for exclusive operation to finish");
  }

  guard.table_ = this;
  guard.keys_  = keys;
  for (const auto& key : keys) {
    auto mutex = MutexFor(key);
    if (!mutex->try_lock_until(deadline)) {
      // the guard's destructor releases what was taken so far
      throw util::StoreTransactionError("lock table: timed out waiting for key " + key);
    }
    guard.held_.push_back(std::move(mutex));
  }
  return guard;
}

EntityLockTable::Guard EntityLockTable::AcquireExclusive(std::chrono::milliseconds timeout) {
  Guard guard;
  guard.exclusive_ = std::unique_lock<std::shared_timed_mutex>(global_, std::defer_lock);
  if (!guard.exclusive_.try_lock_for(timeout)) {
    throw util::StoreTransactionError("lock table: timed out waiting for in-flight batches");
  }
  return guard;
}

std::size_t EntityLockTable::Size() const {
  std::lock_guard lock(guard_);
  return mutexes_.size();
}

} // namespace netmap::lock
