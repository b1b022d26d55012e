#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "ingest_task.hpp"

namespace netmap::ingest {

/*
  Thread-safe blocking queue for ingest workers.

  After Shutdown() nothing new is accepted, but queued tasks are still
  handed out until the queue is empty.
*/
class IngestScheduler {
 public:
  // Returns false (task untouched) once shut down.
  bool Enqueue(IngestTask& task);

  // blocking wait
  std::optional<IngestTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<IngestTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace netmap::ingest
