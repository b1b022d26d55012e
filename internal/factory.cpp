#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace netmap::factory {

using netmap::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite       = database.sqlite();
    const auto  busy_timeout = config::DurationOr(sqlite.busy_timeout(), std::chrono::seconds(5), "database.sqlite.busy_timeout");
    const bool  wal_mode     = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_timeout, wal_mode);
    db::sqlite::BootstrapSchema(*sqlite_db);
    NETMAP_LOG_INFO("sqlite store opened", {observability::StringField("path", sqlite.path()), observability::BoolField("wal", wal_mode)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  NETMAP_LOG_INFO("memory store opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::GraphManagerOptions BuildManagerOptions(const RuntimeConfig& config, util::NowFn now) {
  core::GraphManagerOptions options;
  options.now = std::move(now);

  const auto& fusion = config.fusion();
  if (fusion.adjacency_base_confidence() > 0.0) options.policy.adjacency_base_confidence = fusion.adjacency_base_confidence();
  if (fusion.route_base_confidence() > 0.0) options.policy.route_base_confidence = fusion.route_base_confidence();
  options.policy.staleness_window = config::DurationOr(fusion.staleness_window(), options.policy.staleness_window, "fusion.staleness_window");
  options.policy.trusted_sources.insert(fusion.trusted_sources().begin(), fusion.trusted_sources().end());

  const auto& ingest = config.ingest();
  if (ingest.max_attempts() > 0) options.retry.max_attempts = ingest.max_attempts();
  options.retry.initial_backoff = config::DurationOr(ingest.initial_backoff(), options.retry.initial_backoff, "ingest.initial_backoff");
  options.retry.max_backoff     = config::DurationOr(ingest.max_backoff(), options.retry.max_backoff, "ingest.max_backoff");
  options.lock_timeout          = config::DurationOr(ingest.lock_timeout(), options.lock_timeout, "ingest.lock_timeout");
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, util::NowFn now) {
  Application app;

  // ------------------------------------------------------------------
  // Store and identity
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.resolver   = std::make_shared<identity::IdentityResolver>();
  app.locks      = std::make_shared<lock::EntityLockTable>();

  app.manager = std::make_shared<core::GraphManager>(app.repository, app.resolver, app.locks, BuildManagerOptions(config, std::move(now)));
  app.manager->Hydrate();

  // ------------------------------------------------------------------
  // Ingest workers
  // ------------------------------------------------------------------
  std::size_t workers = config.ingest().workers();
  if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());

  app.scheduler = std::make_shared<ingest::IngestScheduler>();
  app.workers   = std::make_shared<ingest::IngestWorkerPool>(app.scheduler, app.manager, workers);

  return app;
}

} // namespace netmap::factory
