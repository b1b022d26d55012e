#include "internal/ingest/ingest_worker_pool.hpp"

#include <cassert>
#include <cstdio>
#include <future>
#include <iostream>
#include <stop_token>

#include "internal/core/graph_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/graph_fixtures.hpp"

namespace {

using netmap::core::MergeReport;
using netmap::db::memory::MemoryRepository;
using netmap::ingest::IngestScheduler;
using netmap::ingest::IngestWorkerPool;
using netmap::model::ObservationRecord;
using namespace netmap::testing;

std::string MacFor(int n) {
  char buffer[18];
  std::snprintf(buffer, sizeof(buffer), "00:16:3e:00:%02x:%02x", (n >> 8) & 0xff, n & 0xff);
  return buffer;
}

// Every source sees the shared gateway plus a few neighbors of its own and
// of the next source, so batches overlap on identity keys.
std::vector<ObservationRecord> BatchFor(int source) {
  const auto                     name = "r" + std::to_string(source);
  std::vector<ObservationRecord> records;
  records.push_back(Arp(name, kT0 + static_cast<std::uint64_t>(source), Named("eth0"), "10.0.0.1", "00:16:3e:ff:ff:01"));
  records.push_back(Route(name, kT0, "0.0.0.0/0", "10.0.0.1", Named("eth0"), static_cast<std::uint32_t>(source)));
  for (int k = 0; k < 3; ++k) {
    const int peer = source * 3 + k;
    records.push_back(Arp(name, kT0, Named("eth0"), "10.1." + std::to_string(peer / 250) + "." + std::to_string(peer % 250 + 2), MacFor(peer)));
  }
  records.push_back(Arp(name, kT0, Named("eth0"), "10.2.0." + std::to_string(source + 2), MacFor(1000 + source)));
  records.push_back(Arp(name, kT0, Named("eth1"), "10.2.0." + std::to_string(source + 3), MacFor(1000 + source + 1)));
  return records;
}

void TestConcurrentBatchesConverge() {
  constexpr int kSources = 24;
  TestClock     clock;

  auto sequential = MakeManager(std::make_shared<MemoryRepository>(), clock);
  for (int s = 0; s < kSources; ++s) sequential->Ingest("r" + std::to_string(s), BatchFor(s));

  auto             concurrent = MakeManager(std::make_shared<MemoryRepository>(), clock);
  IngestWorkerPool pool(std::make_shared<IngestScheduler>(), concurrent, 6);
  pool.Start();

  std::vector<std::future<MergeReport>> futures;
  for (int s = kSources - 1; s >= 0; --s) futures.push_back(pool.Submit("r" + std::to_string(s), BatchFor(s)));

  std::size_t accepted = 0;
  for (auto& future : futures) {
    const auto report = future.get();
    assert(report.rejected == 0);
    accepted += report.accepted;
  }
  pool.Stop();

  assert(accepted == kSources * 7);
  assert(Capture(*concurrent) == Capture(*sequential));
}

void TestQueuedBatchesDrainOnStop() {
  TestClock        clock;
  auto             manager = MakeManager(std::make_shared<MemoryRepository>(), clock);
  IngestWorkerPool pool(std::make_shared<IngestScheduler>(), manager, 2);

  // queued before any worker runs
  auto first  = pool.Submit("r1", BatchFor(1));
  auto second = pool.Submit("r2", std::vector{RawArp("eth0", "10.3.0.2", "00:16:3e:aa:00:02")});
  pool.Start();
  pool.Stop();

  assert(first.get().accepted == 7);
  assert(second.get().accepted == 1);

  auto late = pool.Submit("r3", BatchFor(3));
  bool threw = false;
  try {
    late.get();
  } catch (const netmap::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestStopWithoutStartCancelsQueued() {
  TestClock clock;
  auto      manager   = MakeManager(std::make_shared<MemoryRepository>(), clock);
  auto      scheduler = std::make_shared<IngestScheduler>();

  std::future<MergeReport> queued;
  {
    IngestWorkerPool pool(scheduler, manager, 2);
    queued = pool.Submit("r1", BatchFor(1));
    pool.Stop();
  }
  assert(scheduler->Pending() == 0);

  bool threw = false;
  try {
    queued.get();
  } catch (const netmap::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(manager->Export().observations.empty());
}

void TestFailuresReachTheSubmitter() {
  TestClock        clock;
  auto             manager = MakeManager(std::make_shared<MemoryRepository>(), clock);
  IngestWorkerPool pool(std::make_shared<IngestScheduler>(), manager, 2);

  std::stop_source stop;
  stop.request_stop();
  netmap::core::IngestOptions cancelled;
  cancelled.cancel = stop.get_token();

  auto cancelled_future = pool.Submit("r1", BatchFor(1), cancelled);
  auto invalid_future   = pool.Submit("", BatchFor(2));
  auto good_future      = pool.Submit("r3", BatchFor(3));
  pool.Start();

  bool cancelled_threw = false;
  try {
    cancelled_future.get();
  } catch (const netmap::util::Cancelled&) {
    cancelled_threw = true;
  }
  assert(cancelled_threw);

  bool invalid_threw = false;
  try {
    invalid_future.get();
  } catch (const netmap::util::InvalidArgument&) {
    invalid_threw = true;
  }
  assert(invalid_threw);

  // one failing batch does not take the pool down
  assert(good_future.get().accepted == 7);
  assert(manager->Export().observations.size() == 7);
  pool.Stop();
}

} // namespace

int main() {
  TestConcurrentBatchesConverge();
  TestQueuedBatchesDrainOnStop();
  TestStopWithoutStartCancelsQueued();
  TestFailuresReachTheSubmitter();

  std::cout << "netmap_unit_ingest_worker_pool: pass\n";
  return 0;
}
