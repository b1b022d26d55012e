#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/graph_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity_resolver.hpp"
#include "internal/ingest/ingest_scheduler.hpp"
#include "internal/ingest/ingest_worker_pool.hpp"
#include "internal/lock/entity_lock_table.hpp"
#include "internal/util/time.hpp"

namespace netmap::factory {

/*
  Application

  Owns all long-lived singletons used by the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<identity::IdentityResolver> resolver;
  std::shared_ptr<lock::EntityLockTable>      locks;
  std::shared_ptr<core::GraphManager>         manager;

  std::shared_ptr<ingest::IngestScheduler>  scheduler;
  std::shared_ptr<ingest::IngestWorkerPool> workers;  // not started
};

std::shared_ptr<db::Repository> BuildRepository(const netmap::runtime::config::RuntimeConfig& config);

core::GraphManagerOptions BuildManagerOptions(const netmap::runtime::config::RuntimeConfig& config, util::NowFn now);

/*
  Build

  Constructs the entire backend based on runtime config and hydrates the
  identity clusters from the store.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const netmap::runtime::config::RuntimeConfig& config, util::NowFn now = util::SystemNow());

} // namespace netmap::factory
