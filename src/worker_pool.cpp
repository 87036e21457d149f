/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "media_jobs/worker_pool.hpp"

#include <algorithm>

#include "media_jobs/logging.hpp"

namespace media_jobs {

WorkerPool::WorkerPool(JobRunner &runner, int num_workers,
                       size_t queue_capacity)
    : runner_(runner), queue_(queue_capacity) {
  num_workers = std::max(1, num_workers);
  workers_.reserve(num_workers);
  for (int i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&WorkerPool::worker_loop, this, i);
  }
  LOG_INFO("Worker pool: {} workers, queue capacity {}", num_workers,
           queue_.capacity());
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(JobTicket &ticket) {
  if (stopped_.load())
    return false;
  return queue_.try_push(ticket);
}

void WorkerPool::shutdown() {
  if (stopped_.exchange(true))
    return;

  /// Signal workers that no more tickets are coming
  queue_.finish();

  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  LOG_INFO("Worker pool stopped ({} jobs)", completed_.load());
}

void WorkerPool::worker_loop(int worker_id) {
  JobTicket ticket;
  while (queue_.pop(ticket)) {
    ++active_;
    LOG_INFO("[Worker {}] Picked job {}", worker_id, ticket.id.substr(0, 8));
    runner_.run(ticket);
    --active_;
    ++completed_;
  }
}

} // namespace media_jobs
