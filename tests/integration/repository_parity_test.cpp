#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/graph_fixtures.hpp"

namespace {

using netmap::db::ErrorCode;
using netmap::db::Repository;
using netmap::db::memory::MemoryRepository;
using netmap::db::model::ConflictRecord;
using netmap::db::model::HostMergeRecord;
using netmap::db::model::HostRecord;
using netmap::db::model::InterfaceRecord;
using netmap::db::model::LinkRecord;
using netmap::db::model::ObservationRow;
using netmap::db::model::PlaceholderRecord;
using netmap::model::EdgeStatus;
using netmap::model::LinkKind;
using netmap::model::ObservationKind;
using namespace netmap::testing;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

InterfaceRecord MakeInterface(const std::string& id, const std::string& host, std::vector<std::string> ips) {
  InterfaceRecord row;
  row.id            = id;
  row.host_id       = host;
  row.seed_host_ids = {host};
  row.link_addresses = {"00163e00000a"};
  for (auto& ip : ips) {
    row.addresses.push_back({std::move(ip), {kT0, kT0 + kMinute}, {"obs-1"}});
  }
  row.seen            = {kT0, kT0 + kMinute};
  row.observation_ids = {"obs-1"};
  return row;
}

LinkRecord MakeRoute(const std::string& id, const std::string& from, const std::string& gateway, const std::string& target) {
  LinkRecord link;
  link.id                    = id;
  link.kind                  = LinkKind::kRoute;
  link.endpoint_a            = from;
  link.endpoint_b            = target;
  link.target_is_placeholder = target.rfind("net", 0) == 0;
  link.destination           = "0.0.0.0/0";
  link.gateway_ip            = gateway;
  link.metric                = 100;
  link.confidence            = 0.3;
  link.status                = EdgeStatus::kProposed;
  link.seen                  = {kT0, kT0};
  link.observation_ids       = {"obs-2"};
  return link;
}

ObservationRow MakeObservation(const std::string& id) {
  ObservationRow row;
  row.id              = id;
  row.source_host_id  = "r1";
  row.observed_at_ms  = kT0;
  row.kind            = ObservationKind::kArp;
  row.local_interface = "eth0";
  row.neighbor_ip     = "10.0.0.10";
  row.neighbor_link   = "00163e00000a";
  row.ingested_at_ms  = kT0 + 1;
  return row;
}

void VerifyRowRoundTrip(Repository& repo) {
  HostRecord host;
  host.id              = "host-1";
  host.interface_ids   = {"if-1"};
  host.labels          = {{"r1", {"obs-1"}}};
  host.seen            = {kT0, kT0 + kMinute};
  host.observation_ids = {"obs-1"};

  PlaceholderRecord placeholder;
  placeholder.id              = "net-1";
  placeholder.gateway_ip      = "10.0.0.1";
  placeholder.destinations    = {"0.0.0.0/0"};
  placeholder.seen            = {kT0, kT0};
  placeholder.observation_ids = {"obs-2"};

  ConflictRecord conflict{"cf-1", "10.0.0.10", "if-1", "if-2", {kT0, kT0}, {"obs-1", "obs-3"}};
  HostMergeRecord merge{"merge-1", "host-1", "host-2", "link addresses aliased", kT0, {"obs-4"}};

  const auto iface = MakeInterface("if-1", "host-1", {"10.0.0.10"});
  const auto route = MakeRoute("ln-1", "if-1", "10.0.0.1", "net-1");

  {
    auto tx = repo.Begin();
    assert(repo.UpsertHost(*tx, host));
    assert(repo.UpsertInterface(*tx, iface));
    assert(repo.UpsertLink(*tx, route));
    assert(repo.UpsertPlaceholder(*tx, placeholder));
    assert(repo.UpsertConflict(*tx, conflict));
    assert(repo.InsertHostMerge(*tx, merge));
    assert(repo.InsertObservation(*tx, MakeObservation("obs-1")));

    // reads inside the transaction see its writes
    assert(repo.GetHost(*tx, "host-1") == host);
    assert(tx->Commit());
  }

  auto tx = repo.Begin();
  assert(repo.GetHost(*tx, "host-1") == host);
  assert(repo.GetInterface(*tx, "if-1") == iface);
  assert(repo.GetLink(*tx, "ln-1") == route);
  assert(repo.GetPlaceholder(*tx, "net-1") == placeholder);
  assert(repo.GetConflict(*tx, "cf-1") == conflict);
  assert(repo.GetObservation(*tx, "obs-1") == MakeObservation("obs-1"));
  assert(repo.ListHostMerges(*tx) == std::vector<HostMergeRecord>{merge});
  assert(repo.ListHosts(*tx).size() == 1);
  assert(!repo.GetHost(*tx, "host-missing").has_value());
  assert(tx->Commit());
}

void VerifyIndexesFollowUpdates(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertInterface(*tx, MakeInterface("if-a", "host-a", {"10.0.0.20", "10.0.0.21"})));
    assert(repo.UpsertInterface(*tx, MakeInterface("if-b", "host-b", {"10.0.0.20"})));
    assert(repo.UpsertLink(*tx, MakeRoute("ln-r", "if-a", "10.0.0.20", "net-x")));

    LinkRecord adjacency;
    adjacency.id         = "ln-adj";
    adjacency.kind       = LinkKind::kAdjacency;
    adjacency.endpoint_a = "if-a";
    adjacency.endpoint_b = "if-b";
    adjacency.gateway_ip = "10.0.0.20";  // never set in practice; must not match a route lookup
    assert(repo.UpsertLink(*tx, adjacency));
    assert(tx->Commit());
  }

  {
    auto tx       = repo.Begin();
    auto claimers = repo.FindInterfacesByIp(*tx, "10.0.0.20");
    assert(claimers.size() == 2);
    assert(claimers[0].id == "if-a");
    assert(claimers[1].id == "if-b");
    assert(repo.FindRoutesByGateway(*tx, "10.0.0.20").size() == 1);

    // dropping a claim drops it from the index; re-aiming keeps the gateway
    assert(repo.UpsertInterface(*tx, MakeInterface("if-b", "host-b", {"10.0.0.22"})));
    assert(repo.UpsertLink(*tx, MakeRoute("ln-r", "if-a", "10.0.0.20", "if-b")));
    assert(tx->Commit());
  }

  auto tx = repo.Begin();
  assert(repo.FindInterfacesByIp(*tx, "10.0.0.20").size() == 1);
  assert(repo.FindInterfacesByIp(*tx, "10.0.0.22").size() == 1);
  auto routes = repo.FindRoutesByGateway(*tx, "10.0.0.20");
  assert(routes.size() == 1);
  assert(routes[0].endpoint_b == "if-b");
  assert(!routes[0].target_is_placeholder);
  assert(tx->Commit());
}

void VerifyAppendOnlyCollections(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertObservation(*tx, MakeObservation("obs-dup")));
  assert(repo.InsertObservation(*tx, MakeObservation("obs-dup")).code == ErrorCode::AlreadyExists);

  HostMergeRecord merge{"merge-dup", "host-1", "host-9", "identity evidence", kT0, {}};
  assert(repo.InsertHostMerge(*tx, merge));
  assert(repo.InsertHostMerge(*tx, merge).code == ErrorCode::AlreadyExists);

  HostRecord unnamed;
  const auto rejected = repo.UpsertHost(*tx, unnamed);
  assert(rejected.code == ErrorCode::ConstraintViolation);
  bool invalid = false;
  try {
    netmap::db::ThrowIfDbError(rejected, "upsert host");
  } catch (const netmap::util::InvalidArgument& e) {
    invalid = std::string(e.what()).starts_with("upsert host: constraint violation");
  }
  assert(invalid);
  assert(tx->Commit());
}

void VerifyRollbackAndHooks(Repository& repo) {
  bool hook_ran = false;
  {
    auto tx = repo.Begin();
    assert(repo.UpsertHost(*tx, HostRecord{.id = "host-rolled-back"}));
    tx->OnCommit([&] { hook_ran = true; });
    tx->Rollback();
  }
  {
    // never committed: the destructor rolls back
    auto tx = repo.Begin();
    assert(repo.UpsertHost(*tx, HostRecord{.id = "host-abandoned"}));
  }
  assert(!hook_ran);

  {
    auto tx = repo.Begin();
    assert(!repo.GetHost(*tx, "host-rolled-back").has_value());
    assert(!repo.GetHost(*tx, "host-abandoned").has_value());
    tx->OnCommit([&] { hook_ran = true; });
    assert(tx->Commit());
    assert(tx->IsCommitted());
  }
  assert(hook_ran);
}

void VerifyReset(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.Reset(*tx));
    assert(repo.ListHosts(*tx).empty());
    assert(tx->Commit());
  }
  auto tx = repo.Begin();
  assert(repo.ListHosts(*tx).empty());
  assert(repo.ListInterfaces(*tx).empty());
  assert(repo.ListLinks(*tx).empty());
  assert(repo.ListObservations(*tx).empty());
  assert(repo.ListPlaceholders(*tx).empty());
  assert(repo.ListConflicts(*tx).empty());
  assert(repo.ListHostMerges(*tx).empty());
  assert(repo.FindInterfacesByIp(*tx, "10.0.0.20").empty());
  assert(repo.FindRoutesByGateway(*tx, "10.0.0.20").empty());
  assert(tx->Commit());
}

void VerifyConcurrentWriters(BackendFactory& backend, Repository& repo) {
  if (!backend.supports_parallel_transactions) {
    return;
  }

  auto first  = repo.Begin();
  auto second = repo.Begin();
  auto third  = repo.Begin();

  (void)repo.GetHost(*first, "host-shared");
  assert(repo.UpsertHost(*first, HostRecord{.id = "host-shared", .interface_ids = {"if-1"}}));
  (void)repo.GetHost(*second, "host-shared");
  assert(repo.UpsertHost(*second, HostRecord{.id = "host-shared", .interface_ids = {"if-2"}}));
  assert(repo.UpsertHost(*third, HostRecord{.id = "host-other"}));

  assert(first->Commit());
  const auto lost = second->Commit();
  assert(lost.code == ErrorCode::Busy);
  assert(third->Commit());

  // contention is the one code the manager retries
  bool retryable = false;
  try {
    netmap::db::ThrowIfDbError(lost, "commit batch");
  } catch (const netmap::util::StoreTransactionError& e) {
    retryable = std::string(e.what()).starts_with("commit batch: busy");
  }
  assert(retryable);

  auto tx = repo.Begin();
  assert(repo.GetHost(*tx, "host-shared")->interface_ids == std::vector<std::string>{"if-1"});
  assert(tx->Commit());
}

void IngestSample(netmap::core::GraphManager& manager) {
  manager.Ingest("r1", std::vector{
                           Arp("r1", kT0, Named("eth0"), "10.0.0.10", "00:16:3e:00:00:0a"),
                           Arp("r1", kT0, Named("eth0"), "10.0.0.1", "00:16:3e:00:00:01"),
                           Route("r1", kT0, "0.0.0.0/0", "10.0.0.1", Named("eth0"), 10),
                           Route("r1", kT0, "192.168.0.0/16", "10.0.0.254", Named("eth0"), 20),
                           Route("r1", kT0, "10.0.0.0/24", "", Named("eth0")),
                       });
  manager.Ingest("r2", std::vector{
                           Arp("r2", kT0 + kMinute, Named("em0"), "10.0.0.10", "00:16:3e:00:00:0b"),
                           Arp("r2", kT0 + kMinute, Named("em0"), "10.0.0.1", "00:16:3e:00:00:01"),
                       });
  manager.Ingest("op", std::vector{Alias("op", kT0, "00:16:3e:00:00:01", "00:16:3e:00:00:0c")});
}

void VerifyManagerParity(BackendFactory& backend) {
  TestClock clock;
  auto      reference = MakeManager(std::make_shared<MemoryRepository>(), clock);
  IngestSample(*reference);

  auto repo    = backend.make_repository();
  auto manager = MakeManager(repo, clock);
  IngestSample(*manager);

  const auto expected = Capture(*reference);
  assert(Capture(*manager) == expected);
  assert(expected.conflicts.size() == 1);
  assert(manager->Export().host_merges == reference->Export().host_merges);

  if (!backend.supports_restart()) {
    return;
  }

  manager.reset();
  backend.restart(repo);

  // a new process: clusters come back from the store
  auto reopened = MakeManager(repo, clock);
  reopened->Hydrate();
  assert(Capture(*reopened) == expected);

  const auto again = reopened->Ingest("r2", std::vector{Arp("r2", kT0 + kMinute, Named("em0"), "10.0.0.10", "00:16:3e:00:00:0b")});
  assert(again.duplicates == 1);
  const auto more = reopened->Ingest("r3", std::vector{Arp("r3", kT0 + kHour, Named("eth0"), "10.0.0.99", "00:16:3e:00:00:0c")});
  assert(more.merges.empty());
  reference->Ingest("r3", std::vector{Arp("r3", kT0 + kHour, Named("eth0"), "10.0.0.99", "00:16:3e:00:00:0c")});
  assert(Capture(*reopened) == Capture(*reference));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory(const std::string& name) {
  const auto db_path = TempPath(name).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<netmap::db::sqlite::SqliteDB>(db_path);
    netmap::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<netmap::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
          },
      .supports_parallel_transactions = false,
  };
}

void RunSuite(BackendFactory backend) {
  auto repo = backend.make_repository();
  VerifyRowRoundTrip(*repo);
  VerifyIndexesFollowUpdates(*repo);
  VerifyAppendOnlyCollections(*repo);
  VerifyRollbackAndHooks(*repo);
  VerifyConcurrentWriters(backend, *repo);
  VerifyReset(*repo);
  repo.reset();
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunSuite(MakeMemoryFactory());
  RunSuite(MakeSqliteFactory("netmap_parity_rows.db"));

  auto memory = MakeMemoryFactory();
  VerifyManagerParity(memory);
  auto sqlite = MakeSqliteFactory("netmap_parity_manager.db");
  VerifyManagerParity(sqlite);
  sqlite.cleanup();

  std::cout << "netmap_integration_repository_parity: pass\n";
  return 0;
}
