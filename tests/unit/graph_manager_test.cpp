#include "internal/core/graph_manager.hpp"

#include <algorithm>
#include <cassert>
#include <functional>
#include <future>
#include <iostream>
#include <stop_token>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/graph_fixtures.hpp"

namespace {

using netmap::core::GraphFilter;
using netmap::core::GraphManager;
using netmap::core::IngestOptions;
using netmap::db::memory::MemoryRepository;
using netmap::identity::LinkHostId;
using netmap::identity::LinkInterfaceId;
using netmap::identity::LocalInterfaceId;
using netmap::model::EdgeStatus;
using netmap::model::LinkKind;
using namespace netmap::testing;

constexpr const char* kMacA = "00:16:3e:00:00:0a";
constexpr const char* kMacB = "00:16:3e:00:00:0b";

std::shared_ptr<GraphManager> Fresh(const TestClock& clock, netmap::fusion::FusionPolicy policy = {}) {
  return MakeManager(std::make_shared<MemoryRepository>(), clock, std::move(policy));
}

/*
  Forwards to a real store and runs a callback once, right after the next
  Begin() has taken its snapshot. Lets a test slip another writer's commit
  in between a batch's store snapshot and the rest of its setup.
*/
class InterleavingRepository final : public netmap::db::Repository {
 public:
  explicit InterleavingRepository(std::shared_ptr<netmap::db::Repository> inner) : inner_(std::move(inner)) {
  }

  void AfterNextBegin(std::function<void()> callback) {
    after_begin_ = std::move(callback);
  }

  std::unique_ptr<netmap::db::Transaction> Begin() override {
    auto tx = inner_->Begin();
    if (after_begin_) {
      auto callback = std::move(after_begin_);
      after_begin_  = nullptr;
      callback();
    }
    return tx;
  }

  netmap::db::Result Reset(netmap::db::Transaction& tx) override {
    return inner_->Reset(tx);
  }

  netmap::db::Result UpsertHost(netmap::db::Transaction& tx, const netmap::db::model::HostRecord& row) override {
    return inner_->UpsertHost(tx, row);
  }
  std::optional<netmap::db::model::HostRecord> GetHost(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetHost(tx, id);
  }
  std::vector<netmap::db::model::HostRecord> ListHosts(netmap::db::Transaction& tx) override {
    return inner_->ListHosts(tx);
  }

  netmap::db::Result UpsertInterface(netmap::db::Transaction& tx, const netmap::db::model::InterfaceRecord& row) override {
    return inner_->UpsertInterface(tx, row);
  }
  std::optional<netmap::db::model::InterfaceRecord> GetInterface(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetInterface(tx, id);
  }
  std::vector<netmap::db::model::InterfaceRecord> ListInterfaces(netmap::db::Transaction& tx) override {
    return inner_->ListInterfaces(tx);
  }
  std::vector<netmap::db::model::InterfaceRecord> FindInterfacesByIp(netmap::db::Transaction& tx, const std::string& ip) override {
    return inner_->FindInterfacesByIp(tx, ip);
  }

  netmap::db::Result UpsertLink(netmap::db::Transaction& tx, const netmap::db::model::LinkRecord& row) override {
    return inner_->UpsertLink(tx, row);
  }
  std::optional<netmap::db::model::LinkRecord> GetLink(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetLink(tx, id);
  }
  std::vector<netmap::db::model::LinkRecord> ListLinks(netmap::db::Transaction& tx) override {
    return inner_->ListLinks(tx);
  }
  std::vector<netmap::db::model::LinkRecord> FindRoutesByGateway(netmap::db::Transaction& tx, const std::string& ip) override {
    return inner_->FindRoutesByGateway(tx, ip);
  }

  netmap::db::Result InsertObservation(netmap::db::Transaction& tx, const netmap::db::model::ObservationRow& row) override {
    return inner_->InsertObservation(tx, row);
  }
  std::optional<netmap::db::model::ObservationRow> GetObservation(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetObservation(tx, id);
  }
  std::vector<netmap::db::model::ObservationRow> ListObservations(netmap::db::Transaction& tx) override {
    return inner_->ListObservations(tx);
  }

  netmap::db::Result UpsertPlaceholder(netmap::db::Transaction& tx, const netmap::db::model::PlaceholderRecord& row) override {
    return inner_->UpsertPlaceholder(tx, row);
  }
  std::optional<netmap::db::model::PlaceholderRecord> GetPlaceholder(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetPlaceholder(tx, id);
  }
  std::vector<netmap::db::model::PlaceholderRecord> ListPlaceholders(netmap::db::Transaction& tx) override {
    return inner_->ListPlaceholders(tx);
  }

  netmap::db::Result UpsertConflict(netmap::db::Transaction& tx, const netmap::db::model::ConflictRecord& row) override {
    return inner_->UpsertConflict(tx, row);
  }
  std::optional<netmap::db::model::ConflictRecord> GetConflict(netmap::db::Transaction& tx, const std::string& id) override {
    return inner_->GetConflict(tx, id);
  }
  std::vector<netmap::db::model::ConflictRecord> ListConflicts(netmap::db::Transaction& tx) override {
    return inner_->ListConflicts(tx);
  }

  netmap::db::Result InsertHostMerge(netmap::db::Transaction& tx, const netmap::db::model::HostMergeRecord& row) override {
    return inner_->InsertHostMerge(tx, row);
  }
  std::vector<netmap::db::model::HostMergeRecord> ListHostMerges(netmap::db::Transaction& tx) override {
    return inner_->ListHostMerges(tx);
  }

 private:
  std::shared_ptr<netmap::db::Repository> inner_;
  std::function<void()>                   after_begin_;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRawRecordsAreNormalizedAndCounted() {
  TestClock clock;
  auto      manager = Fresh(clock);

  const auto report = manager->Ingest("r1", std::vector<netmap::normalize::RawRecord>{
                                                RawArp("eth0", "10.0.0.10", "00-16-3e-00-00-0a"),
                                                RawArp("eth0", "10.0.0.11", "not-a-mac"),
                                                RawArp("eth0", "10.0.0.12", "00:16:3e:00:00:0c", "yesterday"),
                                            });
  assert(report.source_host_id == "r1");
  assert(report.accepted == 1);
  assert(report.rejected == 2);
  assert(report.duplicates == 0);
  assert(report.errors.size() == 2);
  assert(report.errors[0].index == 1);
  assert(report.errors[0].field == "neighbor_link");
  assert(report.errors[1].index == 2);
  assert(report.errors[1].field == "observed_at");
  assert(report.attempts == 1);
  assert(!report.dry_run);
}

void TestBatchSourceIsEnforced() {
  TestClock clock;
  auto      manager = Fresh(clock);

  const auto report = manager->Ingest("r1", std::vector{
                                                Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA),
                                                Arp("r2", kT0, Named("eth0"), "10.0.0.11", kMacB),
                                            });
  assert(report.accepted == 1);
  assert(report.rejected == 1);
  assert(report.errors[0].field == "source_host_id");

  assert(Throws<netmap::util::InvalidArgument>([&] { manager->Ingest("", std::vector<netmap::model::ObservationRecord>{}); }));
}

void TestReingestIsIdempotent() {
  TestClock  clock;
  auto       manager = Fresh(clock);
  const auto batch   = std::vector{
      Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA),
      Route("r1", kT0, "0.0.0.0/0", "10.0.0.1", Named("eth0"), 10),
  };

  const auto first = manager->Ingest("r1", batch);
  assert(first.accepted == 2);
  const auto before = Capture(*manager);

  const auto second = manager->Ingest("r1", batch);
  assert(second.accepted == 0);
  assert(second.duplicates == 2);
  assert(second.created.empty());
  assert(Capture(*manager) == before);
}

void TestHostLookupFollowsMerges() {
  TestClock clock;
  auto      manager = Fresh(clock);
  manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)});
  manager->Ingest("r2", std::vector{Arp("r2", kT0, Named("eth0"), "10.0.1.10", kMacB)});
  const auto report = manager->Ingest("op", std::vector{Alias("op", kT0, kMacA, kMacB)});
  assert(report.merges.size() == 1);

  const auto survivor = report.merges[0].survivor_id;
  const auto absorbed = report.merges[0].absorbed_id;
  assert(manager->GetHost(absorbed).id == survivor);
  assert(manager->GetHost(survivor).id == survivor);
  assert(manager->GetHost(LinkHostId(Mac(kMacA))).interface_ids.size() == 2);

  assert(Throws<netmap::util::NotFound>([&] { manager->GetHost("host-nope"); }));

  // absorbed stubs never show up as live hosts
  for (const auto& host : manager->GetGraph().hosts) assert(host.id != absorbed);
}

void TestCurrentOwnerIsLatestClaim() {
  TestClock clock;
  auto      manager = Fresh(clock);
  assert(!manager->CurrentOwner("10.0.0.10").has_value());
  assert(Throws<netmap::util::InvalidArgument>([&] { manager->CurrentOwner("10.0.0.300"); }));

  manager->Ingest("r1", std::vector{Arp("r1", kT0 + kHour, Named("eth0"), "10.0.0.10", kMacA)});
  manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacB)});

  auto owner = manager->CurrentOwner("10.0.0.10");
  assert(owner.has_value());
  assert(owner->id == LinkInterfaceId(Mac(kMacA)));

  // the conflict is recorded either way
  assert(manager->GetGraph().conflicts.size() == 1);
}

void TestStatusIsDerivedAndSwept() {
  TestClock clock;
  netmap::fusion::FusionPolicy policy;
  policy.staleness_window = std::chrono::hours(24);
  auto manager            = Fresh(clock, policy);

  manager->Ingest("r1", std::vector{
                            Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA),
                            Arp("r1", kT0 + kMinute, Named("eth0"), "10.0.0.10", kMacA),
                            Route("r1", kT0, "10.9.0.0/16", "10.0.0.10", Named("eth0")),
                        });

  auto graph = manager->GetGraph();
  assert(graph.links.size() == 2);
  for (const auto& view : graph.links) {
    if (view.link.kind == LinkKind::kAdjacency) assert(view.link.status == EdgeStatus::kConfirmed);
    if (view.link.kind == LinkKind::kRoute) {
      assert(view.link.status == EdgeStatus::kProposed);
      assert(view.host_b == LinkHostId(Mac(kMacA)));
    }
  }

  clock.Advance(25 * kHour);
  graph = manager->GetGraph();
  std::size_t stale = 0;
  for (const auto& view : graph.links) stale += view.link.status == EdgeStatus::kStale;
  assert(stale == 1);
  assert(manager->GetGraph(GraphFilter{.include_stale = false}).links.size() == 1);
  assert(manager->GetGraph(GraphFilter{.min_confidence = 0.5}).links.size() == 1);

  // only the export sees what is actually stored
  for (const auto& view : manager->Export().links) assert(view.link.status != EdgeStatus::kStale);

  auto sweep = manager->Sweep();
  assert(sweep.examined == 2);
  assert(sweep.changed == 1);
  assert(manager->Sweep().changed == 0);

  // fresh corroboration brings it back
  manager->Ingest("r1", std::vector{Arp("r1", kT0 + 25 * kHour, Named("eth0"), "10.0.0.10", kMacA)});
  for (const auto& view : manager->Export().links) {
    if (view.link.kind == LinkKind::kAdjacency) assert(view.link.status == EdgeStatus::kConfirmed);
  }
}

void TestSecondSourcePromotesAdjacency() {
  TestClock clock;
  auto      manager = Fresh(clock);

  // each side names its own link address, so both rows describe one edge
  manager->Ingest("r1", std::vector{Arp("r1", kT0, ByMac(kMacA), "10.0.0.11", kMacB)});
  auto graph = manager->GetGraph();
  assert(graph.links.size() == 1);
  assert(graph.links[0].link.status == EdgeStatus::kProposed);

  manager->Ingest("r2", std::vector{Arp("r2", kT0 + kMinute, ByMac(kMacB), "10.0.0.10", kMacA)});
  graph = manager->GetGraph();
  assert(graph.links.size() == 1);
  const auto& link = graph.links[0].link;
  assert(link.kind == LinkKind::kAdjacency);
  assert(link.status == EdgeStatus::kConfirmed);
  assert(link.observation_ids.size() == 2);
  assert(link.confidence > 0.5);
  assert(graph.links[0].host_a != graph.links[0].host_b);
}

void TestBatchRacingAnotherCommitStartsOver() {
  TestClock clock;
  auto      store      = std::make_shared<MemoryRepository>();
  auto      interleave = std::make_shared<InterleavingRepository>(store);
  auto      resolver   = std::make_shared<netmap::identity::IdentityResolver>();

  netmap::core::GraphManagerOptions options;
  options.now                   = clock.Fn();
  options.retry.initial_backoff = std::chrono::milliseconds(1);
  options.retry.max_backoff     = std::chrono::milliseconds(2);

  // same store and clusters, separate lock tables: nothing orders the two
  GraphManager manager(interleave, resolver, std::make_shared<netmap::lock::EntityLockTable>(), options);
  GraphManager other(store, resolver, std::make_shared<netmap::lock::EntityLockTable>(), options);

  // s1 and s2 report the same own link address, so they are one host
  manager.Ingest("s1", std::vector{Arp("s1", kT0, ByMac(kMacA), "10.0.0.20", "00:16:3e:00:00:20")});
  manager.Ingest("s2", std::vector{Arp("s2", kT0, ByMac(kMacA), "10.0.0.21", "00:16:3e:00:00:21")});

  // s2 adds an interface to that host after s1's batch took its snapshot
  std::size_t interleaved = 0;
  interleave->AfterNextBegin([&] {
    interleaved = other.Ingest("s2", std::vector{Arp("s2", kT0 + kMinute, Named("eth1"), "10.0.0.22", "00:16:3e:00:00:22")}).accepted;
  });
  const auto report = manager.Ingest("s1", std::vector{Arp("s1", kT0 + kMinute, Named("eth0"), "10.0.0.23", "00:16:3e:00:00:23")});
  assert(interleaved == 1);
  assert(report.accepted == 1);
  assert(report.attempts == 1);

  std::string host_of_eth0;
  std::string host_of_eth1;
  for (const auto& row : manager.Export().interfaces) {
    if (row.id == LocalInterfaceId("s1", "eth0")) host_of_eth0 = row.host_id;
    if (row.id == LocalInterfaceId("s2", "eth1")) host_of_eth1 = row.host_id;
  }
  assert(!host_of_eth0.empty());
  assert(host_of_eth0 == host_of_eth1);

  const auto host = manager.GetHost(host_of_eth0);
  const auto has  = [&](const std::string& id) {
    return std::find(host.interface_ids.begin(), host.interface_ids.end(), id) != host.interface_ids.end();
  };
  assert(has(LocalInterfaceId("s1", "eth0")));
  assert(has(LocalInterfaceId("s2", "eth1")));
  assert(has(LinkInterfaceId(Mac(kMacA))));
}

void TestDryRunLeavesNoTrace() {
  TestClock clock;
  auto      manager = Fresh(clock);

  IngestOptions options;
  options.dry_run   = true;
  const auto report = manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)}, options);
  assert(report.dry_run);
  assert(report.accepted == 1);
  assert(!report.created.empty());

  assert(manager->GetGraph().hosts.empty());
  assert(!manager->CurrentOwner("10.0.0.10").has_value());

  // still new afterwards
  assert(manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)}).accepted == 1);
}

void TestCancelledBatchIsNotCommitted() {
  TestClock clock;
  auto      manager = Fresh(clock);

  std::stop_source stop;
  stop.request_stop();
  IngestOptions options;
  options.cancel = stop.get_token();

  assert(Throws<netmap::util::Cancelled>(
      [&] { manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)}, options); }));
  assert(manager->Export().observations.empty());
}

void TestLockContentionIsRetried() {
  TestClock clock;
  auto      locks = std::make_shared<netmap::lock::EntityLockTable>();

  netmap::core::GraphManagerOptions options;
  options.now                   = clock.Fn();
  options.lock_timeout          = std::chrono::milliseconds(5);
  options.retry.max_attempts    = 3;
  options.retry.initial_backoff = std::chrono::milliseconds(1);
  options.retry.max_backoff     = std::chrono::milliseconds(2);
  auto manager = std::make_shared<GraphManager>(std::make_shared<MemoryRepository>(), std::make_shared<netmap::identity::IdentityResolver>(),
                                                locks, options);

  const auto batch = std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)};

  // held for the whole call: retries run out
  {
    auto held = locks->Acquire({"src:r1"}, std::chrono::milliseconds(100));
    auto outcome = std::async(std::launch::async, [&] {
      try {
        manager->Ingest("r1", batch);
      } catch (const netmap::util::StoreTransactionError& e) {
        return std::string(e.what());
      }
      return std::string();
    });
    const auto message = outcome.get();
    assert(message.find("giving up after 3 attempts") != std::string::npos);
  }
  assert(manager->Export().observations.empty());

  // released while retrying: the batch goes through
  options.retry.max_attempts    = 200;
  options.retry.initial_backoff = std::chrono::milliseconds(5);
  options.retry.max_backoff     = std::chrono::milliseconds(5);
  auto patient = std::make_shared<GraphManager>(std::make_shared<MemoryRepository>(), std::make_shared<netmap::identity::IdentityResolver>(),
                                                locks, options);
  auto held = std::make_unique<netmap::lock::EntityLockTable::Guard>(locks->Acquire({"src:r1"}, std::chrono::milliseconds(100)));
  auto outcome = std::async(std::launch::async, [&] { return patient->Ingest("r1", batch); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  held.reset();
  const auto report = outcome.get();
  assert(report.accepted == 1);
  assert(report.attempts > 1);
}

void TestForceRecreateStartsOver() {
  TestClock clock;
  auto      manager = Fresh(clock);
  manager->Ingest("r1", std::vector{Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA)});

  IngestOptions options;
  options.force_recreate = true;
  manager->Ingest("r2", std::vector{Arp("r2", kT0, Named("eth0"), "10.0.1.10", kMacB)}, options);

  const auto graph = manager->GetGraph();
  assert(graph.hosts.size() == 2);
  assert(!manager->CurrentOwner("10.0.0.10").has_value());
  assert(manager->CurrentOwner("10.0.1.10").has_value());
  assert(Throws<netmap::util::NotFound>([&] { manager->GetHost(LinkHostId(Mac(kMacA))); }));
}

void TestExportImportRestoresGraph() {
  TestClock clock;
  auto      source = Fresh(clock);
  source->Ingest("r1", std::vector{
                           Arp("r1", kT0, Named("eth0"), "10.0.0.10", kMacA),
                           Route("r1", kT0, "0.0.0.0/0", "10.0.0.1", Named("eth0"), 5),
                       });
  source->Ingest("op", std::vector{Alias("op", kT0, kMacA, kMacB)});

  const auto snapshot = source->Export();
  assert(!snapshot.host_merges.empty());
  assert(snapshot.observations.size() == 3);

  auto target = Fresh(clock);
  target->Ingest("junk", std::vector{Arp("junk", kT0, Named("eth9"), "10.9.9.9", "00:16:3e:00:00:99")});
  target->Import(snapshot);

  assert(Capture(*target) == Capture(*source));
  assert(target->Export().host_merges == snapshot.host_merges);
  const auto absorbed = snapshot.host_merges[0].absorbed_id;
  assert(target->GetHost(absorbed).id == snapshot.host_merges[0].survivor_id);

  // clusters were rebuilt: new evidence lands on the imported host
  const auto report = target->Ingest("r3", std::vector{Arp("r3", kT0 + kMinute, Named("eth0"), "10.0.0.20", kMacB)});
  assert(report.merges.empty());
  assert(target->GetHost(LinkHostId(Mac(kMacB))).id == snapshot.host_merges[0].survivor_id);
}

} // namespace

int main() {
  TestRawRecordsAreNormalizedAndCounted();
  TestBatchSourceIsEnforced();
  TestReingestIsIdempotent();
  TestHostLookupFollowsMerges();
  TestCurrentOwnerIsLatestClaim();
  TestStatusIsDerivedAndSwept();
  TestSecondSourcePromotesAdjacency();
  TestDryRunLeavesNoTrace();
  TestCancelledBatchIsNotCommitted();
  TestLockContentionIsRetried();
  TestBatchRacingAnotherCommitStartsOver();
  TestForceRecreateStartsOver();
  TestExportImportRestoresGraph();

  std::cout << "netmap_unit_graph_manager: pass\n";
  return 0;
}
