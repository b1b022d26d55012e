#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/graph_view.hpp"
#include "internal/core/merge_report.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fusion/confidence.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/lock/entity_lock_table.hpp"
#include "internal/model/observation.hpp"
#include "internal/normalize/raw_record.hpp"
#include "internal/util/time.hpp"

namespace netmap::core {

struct RetryPolicy {
  std::size_t               max_attempts    = 5;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(10);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(500);
};

struct GraphManagerOptions {
  fusion::FusionPolicy      policy;
  RetryPolicy               retry;
  std::chrono::milliseconds lock_timeout = std::chrono::seconds(5);
  util::NowFn               now          = util::SystemNow();
};

struct SweepReport {
  std::size_t examined = 0;
  std::size_t changed  = 0;
};

/*
  GraphManager

  Ingestion and query front of the engine. Owns nothing but policy: the
  store, the identity resolver and the lock table are injected so several
  managers (or a worker pool) can share them.

  One Ingest call is one batch: normalized, locked, applied inside one
  store transaction and one resolver session, and committed all at once.
  Contention is retried with exponential backoff; anything else aborts the
  batch with the store untouched.
*/
class GraphManager {
 public:
  GraphManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> resolver,
               std::shared_ptr<lock::EntityLockTable> locks, GraphManagerOptions options = {});

  MergeReport Ingest(const std::string& source_host_id, const std::vector<normalize::RawRecord>& records, const IngestOptions& options = {});

  MergeReport Ingest(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records,
                     const IngestOptions& options = {});

  GraphSnapshot GetGraph(const GraphFilter& filter = {});

  // An absorbed id resolves to the host that absorbed it.
  db::model::HostRecord GetHost(const std::string& id);

  std::optional<db::model::InterfaceRecord> CurrentOwner(const std::string& ip);

  // Persists status transitions that queries only derive.
  SweepReport Sweep();

  // Everything in the store, absorbed hosts and history included.
  GraphSnapshot Export();

  // Replaces the store content with a snapshot taken by Export().
  void Import(const GraphSnapshot& snapshot);

  // Rebuilds identity clusters from the store (process start).
  void Hydrate();

  const fusion::FusionPolicy& Policy() const {
    return options_.policy;
  }

 private:
  MergeReport IngestNormalized(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records,
                               MergeReport report, const IngestOptions& options);

  fusion::BatchEffects RunBatch(const std::vector<model::ObservationRecord>& records, const std::vector<std::string>& keys,
                                const IngestOptions& options);

  template <typename Fn>
  auto WithRetry(const std::string& what, const std::stop_token& cancel, std::size_t* attempts, Fn&& fn) -> decltype(fn());

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<identity::IdentityResolver> resolver_;
  std::shared_ptr<lock::EntityLockTable>      locks_;
  GraphManagerOptions                         options_;
};

// Identity keys a batch may touch, sorted and unique.
std::vector<std::string> LockKeys(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records);

} // namespace netmap::core
