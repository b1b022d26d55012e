#include "memory_tx.hpp"

#include <string_view>

namespace netmap::db::memory {

namespace {

template <typename Map>
void CopyEntry(Map& committed, const Map& working, const std::string& id) {
  auto it = working.find(id);
  if (it == working.end()) {
    committed.erase(id);
  } else {
    committed[id] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

Result MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    return Result::Err(ErrorCode::InternalError, "transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);

  if (write_keys_.empty() && !reset_) {
    committed_ = true;
    RunCommitHooks();
    return Result::Ok();
  }

  if (reset_) {
    if (repo_.committed_version_ != snapshot_version_) {
      return Result::Err(ErrorCode::Busy, "transaction conflict: store was modified during reset");
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
    repo_.reset_version_ = repo_.committed_version_;
    repo_.key_versions_.clear();
    committed_ = true;
    RunCommitHooks();
    return Result::Ok();
  }

  if (repo_.reset_version_ > snapshot_version_) {
    return Result::Err(ErrorCode::Busy, "transaction conflict: store was reset");
  }

  auto stale = [&](const std::string& key) {
    auto it = repo_.key_versions_.find(key);
    return it != repo_.key_versions_.end() && it->second > snapshot_version_;
  };
  for (const auto& key : read_keys_) {
    if (stale(key)) return Result::Err(ErrorCode::Busy, "transaction conflict on " + key);
  }
  for (const auto& key : write_keys_) {
    if (stale(key)) return Result::Err(ErrorCode::Busy, "transaction conflict on " + key);
  }

  const auto version = ++repo_.committed_version_;
  auto&      target  = repo_.committed_;
  for (const auto& key : write_keys_) {
    const std::string id = key.substr(2);
    switch (key[0]) {
      case 'h':
        CopyEntry(target.hosts, working_.hosts, id);
        break;
      case 'i':
        CopyEntry(target.interfaces, working_.interfaces, id);
        break;
      case 'l':
        CopyEntry(target.links, working_.links, id);
        break;
      case 'o':
        CopyEntry(target.observations, working_.observations, id);
        break;
      case 'p':
        CopyEntry(target.placeholders, working_.placeholders, id);
        break;
      case 'c':
        CopyEntry(target.conflicts, working_.conflicts, id);
        break;
      case 'm':
        CopyEntry(target.host_merges, working_.host_merges, id);
        break;
      case 'x':
        CopyEntry(target.ip_index, working_.ip_index, id);
        break;
      case 'g':
        CopyEntry(target.gateway_index, working_.gateway_index, id);
        break;
      default:
        break;
    }
    repo_.key_versions_[key] = version;
  }

  // still under the store mutex, so no Begin() can see the writes first
  committed_ = true;
  RunCommitHooks();
  return Result::Ok();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace netmap::db::memory
