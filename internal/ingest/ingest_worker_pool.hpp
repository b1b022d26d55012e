#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ingest_scheduler.hpp"

namespace netmap::core {
class GraphManager;
}

namespace netmap::ingest {

/*
  Runs submitted batches on N worker threads.

  Batches are independent units of work; the manager's lock table and the
  store's transactions decide what may actually run side by side. Failures
  (including cancellation) reach the submitter through the future.
*/
class IngestWorkerPool {
 public:
  IngestWorkerPool(std::shared_ptr<IngestScheduler> scheduler, std::shared_ptr<core::GraphManager> manager, std::size_t workers);
  ~IngestWorkerPool();

  void Start();

  // Finishes queued batches, then joins the workers. Batches of a pool that
  // was never started fail with util::Cancelled.
  void Stop();

  std::future<core::MergeReport> Submit(std::string source_host_id, std::vector<normalize::RawRecord> records,
                                        core::IngestOptions options = {});

  std::future<core::MergeReport> Submit(std::string source_host_id, std::vector<model::ObservationRecord> records,
                                        core::IngestOptions options = {});

  std::size_t Workers() const {
    return workers_;
  }

 private:
  std::future<core::MergeReport> Enqueue(IngestTask task);

  void Run(std::size_t worker);

  std::shared_ptr<IngestScheduler>    scheduler_;
  std::shared_ptr<core::GraphManager> manager_;
  std::size_t                         workers_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace netmap::ingest
