/**
 * @file job_queue.hpp
 * @brief Bounded, thread-safe job queue for the worker pool
 *
 * @details Submissions push tickets without blocking; workers pop them:
 *
 *          - try_push() fails instead of waiting when the queue is full
 *
 *          - pop() blocks until a ticket arrives or the queue is finished
 *
 *          - tickets already queued at finish() are still handed out
 */

#ifndef MEDIA_JOBS_JOB_QUEUE_HPP
#define MEDIA_JOBS_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "types.hpp"

namespace media_jobs {

/**
 * @class JobQueue
 * @brief FIFO of job tickets with a fixed capacity.
 */
class JobQueue {
public:
  /**
   * @param capacity Maximum number of waiting tickets (at least 1)
   */
  explicit JobQueue(size_t capacity);

  /**
   * @brief Push a ticket if there is room.
   * @param ticket The ticket; left untouched when rejected
   * @return false if the queue is full or finished
   */
  bool try_push(JobTicket &ticket);

  /**
   * @brief Pop a ticket from the queue (blocking).
   * @param ticket Output: the next ticket
   * @return true if a ticket was retrieved, false if the queue is finished
   *         and drained
   */
  bool pop(JobTicket &ticket);

  /**
   * @brief Signal that no more tickets will be pushed.
   */
  void finish();

  /**
   * @brief Check if queue is finished and empty.
   */
  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<JobTicket> tickets_;
  std::atomic<bool> done_{false};
};

} // namespace media_jobs

#endif // MEDIA_JOBS_JOB_QUEUE_HPP
