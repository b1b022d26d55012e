#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace netmap::lock {

/*
  EntityLockTable

  Keyed timed mutexes for the identity keys a batch touches (source host,
  link addresses, IPs). Keys are locked in sorted order so two batches can
  never wait on each other in a cycle. Entries are dropped once no guard
  holds them.

  A shared global lock sits above the keyed ones; AcquireExclusive takes it
  exclusively for operations that touch everything (store reset, sweep).

  Timeouts throw util::StoreTransactionError, which callers retry.
*/
class EntityLockTable {
 public:
  class Guard {
   public:
    Guard() = default;
    ~Guard();

    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    void Release();

    const std::vector<std::string>& Keys() const {
      return keys_;
    }

   private:
    friend class EntityLockTable;

    EntityLockTable*                               table_ = nullptr;
    std::vector<std::string>                       keys_;
    std::vector<std::shared_ptr<std::timed_mutex>> held_;
    std::shared_lock<std::shared_timed_mutex>      shared_;
    std::unique_lock<std::shared_timed_mutex>      exclusive_;
  };

  Guard Acquire(std::vector<std::string> keys, std::chrono::milliseconds timeout);

  Guard AcquireExclusive(std::chrono::milliseconds timeout);

  // Number of keys currently tracked.
  std::size_t Size() const;

 private:
  std::shared_ptr<std::timed_mutex> MutexFor(const std::string& key);
  void                              Prune(const std::vector<std::string>& keys);

  std::shared_timed_mutex global_;

  mutable std::mutex                                                 guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> mutexes_;
};

} // namespace netmap::lock
