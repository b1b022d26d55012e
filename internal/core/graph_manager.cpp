#include "graph_manager.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <utility>

#include "internal/db/api/db_error.hpp"
#include "internal/fusion/topology_engine.hpp"
#include "internal/normalize/record_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace netmap::core {

using db::ThrowIfDbError;

namespace {

void ThrowIfCancelled(const std::stop_token& cancel, const std::string& what) {
  if (cancel.stop_requested()) {
    throw util::Cancelled(what + ": cancelled before commit");
  }
}

// Returns false if cancellation was requested while waiting.
bool SleepFor(std::chrono::milliseconds delay, const std::stop_token& cancel) {
  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            lock(mutex);
  cv.wait_for(lock, cancel, delay, [] { return false; });
  return !cancel.stop_requested();
}

void AddRefKeys(const model::InterfaceRef& ref, std::set<std::string>& keys) {
  if (ref.link) keys.insert("lnk:" + ref.link->ToString());
  if (ref.ip) keys.insert("ip:" + ref.ip->ToString());
}

} // namespace

std::vector<std::string> LockKeys(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records) {
  std::set<std::string> keys;
  keys.insert("src:" + source_host_id);
  for (const auto& record : records) {
    if (const auto* arp = record.arp()) {
      AddRefKeys(arp->local_interface, keys);
      keys.insert("lnk:" + arp->neighbor_link.ToString());
      keys.insert("ip:" + arp->neighbor_ip.ToString());
    } else if (const auto* route = record.route()) {
      AddRefKeys(route->out_interface, keys);
      if (route->gateway) keys.insert("ip:" + route->gateway->ToString());
    } else if (const auto* alias = record.alias()) {
      keys.insert("lnk:" + alias->link.ToString());
      if (alias->peer_link) keys.insert("lnk:" + alias->peer_link->ToString());
    }
  }
  return {keys.begin(), keys.end()};
}

GraphManager::GraphManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityResolver> resolver,
                           std::shared_ptr<lock::EntityLockTable> locks, GraphManagerOptions options)
    : repository_(std::move(repository)), resolver_(std::move(resolver)), locks_(std::move(locks)), options_(std::move(options)) {
  if (!repository_) throw util::InvalidArgument("graph manager: repository is required");
  if (!resolver_) resolver_ = std::make_shared<identity::IdentityResolver>();
  if (!locks_) locks_ = std::make_shared<lock::EntityLockTable>();
  if (!options_.now) options_.now = util::SystemNow();
  if (options_.retry.max_attempts == 0) options_.retry.max_attempts = 1;
}

template <typename Fn>
auto GraphManager::WithRetry(const std::string& what, const std::stop_token& cancel, std::size_t* attempts, Fn&& fn) -> decltype(fn()) {
  auto backoff = options_.retry.initial_backoff;
  for (std::size_t attempt = 1;; ++attempt) {
    if (attempts) *attempts = attempt;
    try {
      return fn();
    } catch (const util::StoreTransactionError& e) {
      if (attempt >= options_.retry.max_attempts) {
        NETMAP_LOG_ERROR("retries exhausted", {observability::StringField("operation", what),
                                               observability::IntField("attempts", static_cast<std::int64_t>(attempt)),
                                               observability::StringField("error", e.what())});
        throw util::StoreTransactionError(what + ": giving up after " + std::to_string(attempt) + " attempts: " + e.what());
      }
      NETMAP_LOG_WARN("transient store failure, retrying",
                      {observability::StringField("operation", what), observability::IntField("attempt", static_cast<std::int64_t>(attempt)),
                       observability::IntField("backoff_ms", backoff.count()), observability::StringField("error", e.what())});
    }
    if (!SleepFor(backoff, cancel)) ThrowIfCancelled(cancel, what);
    backoff = std::min(backoff * 2, options_.retry.max_backoff);
  }
}

// ------------------------------------------------------------------
// Ingest
// ------------------------------------------------------------------

MergeReport GraphManager::Ingest(const std::string& source_host_id, const std::vector<normalize::RawRecord>& records,
                                 const IngestOptions& options) {
  if (source_host_id.empty()) throw util::InvalidArgument("ingest: source host id is required");
  observability::ScopedLogContext log_context({observability::StringField("source", source_host_id)});

  MergeReport report;
  report.source_host_id = source_host_id;

  const normalize::RecordNormalizer      normalizer(source_host_id);
  std::vector<model::ObservationRecord> normalized;
  normalized.reserve(records.size());

  for (std::size_t i = 0; i < records.size(); ++i) {
    auto result = normalizer.Normalize(records[i], i);
    if (auto* error = std::get_if<normalize::NormalizationError>(&result)) {
      NETMAP_LOG_DEBUG("record rejected", {observability::IntField("index", static_cast<std::int64_t>(error->index)),
                                           observability::StringField("field", error->field), observability::StringField("reason", error->reason)});
      report.errors.push_back(std::move(*error));
      ++report.rejected;
      continue;
    }
    normalized.push_back(std::move(std::get<model::ObservationRecord>(result)));
  }

  return IngestNormalized(source_host_id, normalized, std::move(report), options);
}

MergeReport GraphManager::Ingest(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records,
                                 const IngestOptions& options) {
  if (source_host_id.empty()) throw util::InvalidArgument("ingest: source host id is required");
  observability::ScopedLogContext log_context({observability::StringField("source", source_host_id)});

  MergeReport report;
  report.source_host_id = source_host_id;

  std::vector<model::ObservationRecord> accepted;
  accepted.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (records[i].source_host_id() != source_host_id) {
      report.errors.push_back({i, "source_host_id", "record source '" + records[i].source_host_id() + "' differs from batch source"});
      ++report.rejected;
      continue;
    }
    accepted.push_back(records[i]);
  }

  return IngestNormalized(source_host_id, accepted, std::move(report), options);
}

MergeReport GraphManager::IngestNormalized(const std::string& source_host_id, const std::vector<model::ObservationRecord>& records,
                                           MergeReport report, const IngestOptions& options) {
  report.dry_run  = options.dry_run;
  const auto what = "ingest " + source_host_id;
  const auto keys = LockKeys(source_host_id, records);

  ThrowIfCancelled(options.cancel, what);
  auto effects = WithRetry(what, options.cancel, &report.attempts, [&] { return RunBatch(records, keys, options); });

  report.accepted   = effects.applied;
  report.duplicates = effects.duplicates;
  report.created    = std::move(effects.created);
  report.conflicts  = std::move(effects.conflicts);
  report.merges     = std::move(effects.merges);

  NETMAP_LOG_INFO(options.dry_run ? "batch evaluated (dry run)" : "batch committed",
                  {observability::IntField("accepted", static_cast<std::int64_t>(report.accepted)),
                   observability::IntField("rejected", static_cast<std::int64_t>(report.rejected)),
                   observability::IntField("duplicates", static_cast<std::int64_t>(report.duplicates)),
                   observability::IntField("created", static_cast<std::int64_t>(report.created.size())),
                   observability::IntField("conflicts", static_cast<std::int64_t>(report.conflicts.size())),
                   observability::IntField("merges", static_cast<std::int64_t>(report.merges.size())),
                   observability::IntField("attempts", static_cast<std::int64_t>(report.attempts))});
  return report;
}

fusion::BatchEffects GraphManager::RunBatch(const std::vector<model::ObservationRecord>& records, const std::vector<std::string>& keys,
                                            const IngestOptions& options) {
  auto guard = options.force_recreate ? locks_->AcquireExclusive(options_.lock_timeout) : locks_->Acquire(keys, options_.lock_timeout);

  // Publish runs inside the store commit, so a batch that committed between
  // the two snapshots shows up as a version change; both are taken again
  auto session = resolver_->BeginSession();
  auto tx      = repository_->Begin();
  while (!resolver_->IsCurrent(session)) {
    ThrowIfCancelled(options.cancel, "ingest");
    tx.reset();
    session = resolver_->BeginSession();
    tx      = repository_->Begin();
  }

  if (options.force_recreate) {
    ThrowIfDbError(repository_->Reset(*tx), "reset store");
    session.Reset();
    NETMAP_LOG_WARN("store reset requested by batch");
  }

  fusion::TopologyEngine engine(*repository_, *tx, session, options_.policy, options_.now());
  for (const auto& record : records) {
    ThrowIfCancelled(options.cancel, "ingest");
    engine.Apply(record);
  }
  engine.Finish();
  ThrowIfCancelled(options.cancel, "ingest");

  if (options.dry_run) {
    tx->Rollback();
    return engine.Effects();
  }

  tx->OnCommit([this, &session] { resolver_->Publish(session); });
  ThrowIfDbError(tx->Commit(), "commit batch");
  return engine.Effects();
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

GraphSnapshot GraphManager::GetGraph(const GraphFilter& filter) {
  auto snapshot = WithRetry("read graph", {}, nullptr, [&] {
    GraphSnapshot out;
    auto          tx = repository_->Begin();
    out.hosts        = repository_->ListHosts(*tx);
    out.interfaces   = repository_->ListInterfaces(*tx);
    auto links       = repository_->ListLinks(*tx);
    out.placeholders = repository_->ListPlaceholders(*tx);
    out.conflicts    = repository_->ListConflicts(*tx);
    ThrowIfDbError(tx->Commit(), "read graph");

    for (auto& link : links) {
      out.links.push_back(LinkView{std::move(link), {}, {}});
    }
    return out;
  });

  snapshot.generated_at_ms = options_.now();

  std::erase_if(snapshot.hosts, [](const auto& host) { return host.IsAbsorbed(); });

  std::map<std::string, std::string> host_of;
  for (const auto& row : snapshot.interfaces) {
    host_of.emplace(row.id, row.host_id);
  }

  std::vector<LinkView> kept;
  for (auto& view : snapshot.links) {
    // status is a function of the clock; stored values may lag until Sweep
    view.link.status = fusion::DeriveStatus(view.link, snapshot.generated_at_ms, options_.policy);
    if (!filter.include_stale && view.link.status == model::EdgeStatus::kStale) continue;
    if (view.link.confidence < filter.min_confidence) continue;

    if (auto it = host_of.find(view.link.endpoint_a); it != host_of.end()) view.host_a = it->second;
    if (!view.link.target_is_placeholder) {
      if (auto it = host_of.find(view.link.endpoint_b); it != host_of.end()) view.host_b = it->second;
    }
    kept.push_back(std::move(view));
  }
  snapshot.links = std::move(kept);
  return snapshot;
}

db::model::HostRecord GraphManager::GetHost(const std::string& id) {
  return WithRetry("get host", {}, nullptr, [&] {
    auto                  tx = repository_->Begin();
    std::set<std::string> visited;
    auto                  current = id;
    for (;;) {
      auto host = repository_->GetHost(*tx, current);
      if (!host) throw util::NotFound("get host: no host with id " + current);
      if (!host->IsAbsorbed()) {
        ThrowIfDbError(tx->Commit(), "get host");
        return std::move(*host);
      }
      if (!visited.insert(current).second) {
        throw util::StoreCorruptionError("get host: merge chain of " + id + " loops at " + current);
      }
      current = host->merged_into;
    }
  });
}

std::optional<db::model::InterfaceRecord> GraphManager::CurrentOwner(const std::string& ip) {
  const auto address = model::IpAddress::Parse(ip);
  if (!address) throw util::InvalidArgument("current owner: '" + ip + "' is not an IP address");

  const auto canonical = address->ToString();
  return WithRetry("current owner", {}, nullptr, [&] {
    auto tx       = repository_->Begin();
    auto claimers = repository_->FindInterfacesByIp(*tx, canonical);
    ThrowIfDbError(tx->Commit(), "current owner");
    return fusion::PickOwner(claimers, canonical);
  });
}

SweepReport GraphManager::Sweep() {
  auto report = WithRetry("sweep", {}, nullptr, [&] {
    SweepReport out;
    const auto  now = options_.now();
    auto        tx  = repository_->Begin();
    for (auto& link : repository_->ListLinks(*tx)) {
      ++out.examined;
      const auto next = fusion::DeriveStatus(link, now, options_.policy);
      if (next == link.status || !model::CanTransition(link.status, next)) continue;
      NETMAP_LOG_DEBUG("link status persisted", {observability::StringField("link", link.id),
                                                 observability::StringField("from", model::ToString(link.status)),
                                                 observability::StringField("to", model::ToString(next))});
      link.status = next;
      ThrowIfDbError(repository_->UpsertLink(*tx, link), "sweep link " + link.id);
      ++out.changed;
    }
    ThrowIfDbError(tx->Commit(), "sweep");
    return out;
  });

  NETMAP_LOG_INFO("sweep finished", {observability::IntField("examined", static_cast<std::int64_t>(report.examined)),
                                     observability::IntField("changed", static_cast<std::int64_t>(report.changed))});
  return report;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

GraphSnapshot GraphManager::Export() {
  return WithRetry("export", {}, nullptr, [&] {
    GraphSnapshot out;
    out.generated_at_ms = options_.now();

    auto tx          = repository_->Begin();
    out.hosts        = repository_->ListHosts(*tx);
    out.interfaces   = repository_->ListInterfaces(*tx);
    out.placeholders = repository_->ListPlaceholders(*tx);
    out.conflicts    = repository_->ListConflicts(*tx);
    out.host_merges  = repository_->ListHostMerges(*tx);
    out.observations = repository_->ListObservations(*tx);
    auto links       = repository_->ListLinks(*tx);
    ThrowIfDbError(tx->Commit(), "export");

    std::map<std::string, std::string> host_of;
    for (const auto& row : out.interfaces) {
      host_of.emplace(row.id, row.host_id);
    }
    for (auto& link : links) {
      LinkView view{std::move(link), {}, {}};
      if (auto it = host_of.find(view.link.endpoint_a); it != host_of.end()) view.host_a = it->second;
      if (!view.link.target_is_placeholder) {
        if (auto it = host_of.find(view.link.endpoint_b); it != host_of.end()) view.host_b = it->second;
      }
      out.links.push_back(std::move(view));
    }
    return out;
  });
}

void GraphManager::Import(const GraphSnapshot& snapshot) {
  WithRetry("import", {}, nullptr, [&] {
    auto guard = locks_->AcquireExclusive(options_.lock_timeout);
    auto tx    = repository_->Begin();
    ThrowIfDbError(repository_->Reset(*tx), "import: reset store");

    for (const auto& row : snapshot.observations) {
      ThrowIfDbError(repository_->InsertObservation(*tx, row), "import observation " + row.id);
    }
    for (const auto& row : snapshot.hosts) {
      ThrowIfDbError(repository_->UpsertHost(*tx, row), "import host " + row.id);
    }
    for (const auto& row : snapshot.interfaces) {
      ThrowIfDbError(repository_->UpsertInterface(*tx, row), "import interface " + row.id);
    }
    for (const auto& view : snapshot.links) {
      ThrowIfDbError(repository_->UpsertLink(*tx, view.link), "import link " + view.link.id);
    }
    for (const auto& row : snapshot.placeholders) {
      ThrowIfDbError(repository_->UpsertPlaceholder(*tx, row), "import placeholder " + row.id);
    }
    for (const auto& row : snapshot.conflicts) {
      ThrowIfDbError(repository_->UpsertConflict(*tx, row), "import conflict " + row.id);
    }
    for (const auto& row : snapshot.host_merges) {
      ThrowIfDbError(repository_->InsertHostMerge(*tx, row), "import host merge " + row.id);
    }

    tx->OnCommit([&] { resolver_->Hydrate(snapshot.interfaces); });
    ThrowIfDbError(tx->Commit(), "import");
    return true;
  });

  NETMAP_LOG_INFO("snapshot imported", {observability::IntField("hosts", static_cast<std::int64_t>(snapshot.hosts.size())),
                                        observability::IntField("links", static_cast<std::int64_t>(snapshot.links.size())),
                                        observability::IntField("observations", static_cast<std::int64_t>(snapshot.observations.size()))});
}

void GraphManager::Hydrate() {
  auto interfaces = WithRetry("hydrate", {}, nullptr, [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListInterfaces(*tx);
    ThrowIfDbError(tx->Commit(), "hydrate");
    return rows;
  });
  resolver_->Hydrate(interfaces);
}

} // namespace netmap::core
