/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of job worker threads
 *
 * @details The WorkerPool bounds how many encodes run at once:
 *
 *          - Spawns N worker threads, each looping on the shared JobQueue
 *
 *          - Each popped ticket is run to completion by a JobRunner
 *
 *          - Tickets beyond the queue capacity are rejected at submission
 *
 * @note Configuration via environment variables:
 *
 *       - MAX_CONCURRENT_JOBS: Number of workers (0 = auto)
 *
 *       - JOB_QUEUE_CAPACITY: Tickets allowed to wait for a worker
 */

#ifndef MEDIA_JOBS_WORKER_POOL_HPP
#define MEDIA_JOBS_WORKER_POOL_HPP

#include <atomic>
#include <thread>
#include <vector>

#include "job_queue.hpp"
#include "job_runner.hpp"

namespace media_jobs {

/**
 * @class WorkerPool
 * @brief Owns the job queue and the threads draining it.
 *
 * @attention SHUTDOWN:
 *
 *   - shutdown() stops accepting tickets
 *
 *   - tickets already queued still run
 *
 *   - returns once every worker has exited
 */
class WorkerPool {
public:
  /**
   * @param runner Runner shared by all workers (must outlive the pool)
   * @param num_workers Worker thread count (at least 1)
   * @param queue_capacity Maximum waiting tickets
   */
  WorkerPool(JobRunner &runner, int num_workers, size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Hand a ticket to the workers.
   * @return false if the queue is full or the pool is shut down
   */
  bool submit(JobTicket &ticket);

  /**
   * @brief Finish the queue and join all workers.
   * @note Idempotent.
   */
  void shutdown();

  int size() const { return static_cast<int>(workers_.size()); }

  /// Tickets waiting for a worker
  size_t queued() const { return queue_.size(); }

  /// Workers currently running a job
  int active() const { return active_.load(); }

  /// Jobs run to completion since start
  int completed() const { return completed_.load(); }

private:
  /**
   * @brief Worker function for each pool thread.
   * @param worker_id The worker's ID (0-indexed)
   */
  void worker_loop(int worker_id);

  JobRunner &runner_;
  JobQueue queue_;
  std::vector<std::thread> workers_;
  std::atomic<int> active_{0};
  std::atomic<int> completed_{0};
  std::atomic<bool> stopped_{false};
};

} // namespace media_jobs

#endif // MEDIA_JOBS_WORKER_POOL_HPP
