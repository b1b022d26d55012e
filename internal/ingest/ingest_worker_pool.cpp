#include "ingest_worker_pool.hpp"

#include <exception>

#include "internal/core/graph_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace netmap::ingest {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

IngestWorkerPool::IngestWorkerPool(std::shared_ptr<IngestScheduler> scheduler, std::shared_ptr<core::GraphManager> manager, std::size_t workers)
    : scheduler_(std::move(scheduler)), manager_(std::move(manager)), workers_(workers == 0 ? 1 : workers) {
}

IngestWorkerPool::~IngestWorkerPool() {
  Stop();
}

void IngestWorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < workers_; ++i) {
    threads_.emplace_back(&IngestWorkerPool::Run, this, i);
  }
  NETMAP_LOG_INFO("ingest workers started", {observability::IntField("workers", static_cast<std::int64_t>(workers_))});
}

void IngestWorkerPool::Stop() {
  scheduler_->Shutdown();
  if (const auto pending = scheduler_->Pending(); pending > 0) {
    NETMAP_LOG_INFO("ingest workers stopping", {observability::IntField("pending", static_cast<std::int64_t>(pending)),
                                                observability::IntField("workers", static_cast<std::int64_t>(threads_.size()))});
  }
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();

  // only left over when no worker ever ran
  while (auto task = scheduler_->Dequeue()) {
    task->promise.set_exception(std::make_exception_ptr(util::Cancelled("ingest pool stopped before the batch ran")));
  }
}

std::future<core::MergeReport> IngestWorkerPool::Submit(std::string source_host_id, std::vector<normalize::RawRecord> records,
                                                        core::IngestOptions options) {
  return Enqueue(IngestTask{std::move(source_host_id), std::move(records), std::move(options), {}});
}

std::future<core::MergeReport> IngestWorkerPool::Submit(std::string source_host_id, std::vector<model::ObservationRecord> records,
                                                        core::IngestOptions options) {
  return Enqueue(IngestTask{std::move(source_host_id), std::move(records), std::move(options), {}});
}

std::future<core::MergeReport> IngestWorkerPool::Enqueue(IngestTask task) {
  auto future = task.promise.get_future();
  if (!scheduler_->Enqueue(task)) {
    task.promise.set_exception(std::make_exception_ptr(util::Cancelled("ingest pool is shut down")));
  }
  return future;
}

void IngestWorkerPool::Run(std::size_t worker) {
  // drain on shutdown: Dequeue only returns nullopt once the queue is empty
  for (;;) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      auto report = std::visit(Overloaded{
                                   [&](const std::vector<normalize::RawRecord>& records) {
                                     return manager_->Ingest(task->source_host_id, records, task->options);
                                   },
                                   [&](const std::vector<model::ObservationRecord>& records) {
                                     return manager_->Ingest(task->source_host_id, records, task->options);
                                   },
                               },
                               task->records);
      task->promise.set_value(std::move(report));
    } catch (const std::exception& e) {
      NETMAP_LOG_WARN("ingest batch failed", {observability::IntField("worker", static_cast<std::int64_t>(worker)),
                                              observability::StringField("source", task->source_host_id),
                                              observability::StringField("error", e.what())});
      task->promise.set_exception(std::current_exception());
    }
  }
}

} // namespace netmap::ingest
