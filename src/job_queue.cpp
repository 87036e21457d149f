/**
 * @file job_queue.cpp
 * @brief Bounded job queue implementation
 */

#include "media_jobs/job_queue.hpp"

#include <algorithm>

namespace media_jobs {

JobQueue::JobQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

bool JobQueue::try_push(JobTicket &ticket) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load() || tickets_.size() >= capacity_)
      return false;
    tickets_.push(std::move(ticket));
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(JobTicket &ticket) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !tickets_.empty() || done_.load(); });

  if (tickets_.empty()) {
    return false;
  }

  ticket = std::move(tickets_.front());
  tickets_.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace media_jobs
