/**
 * @file job_store.cpp
 * @brief Job registry implementation
 */

#include "media_jobs/job_store.hpp"

#include <algorithm>

namespace media_jobs {

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Running:
    return "running";
  case JobStatus::Done:
    return "done";
  case JobStatus::Error:
    return "error";
  }
  return "unknown";
}

bool JobStore::create(JobState initial) {
  auto entry = std::make_unique<Entry>();
  std::string id = initial.id;
  entry->state = std::move(initial);

  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  return entries_.emplace(std::move(id), std::move(entry)).second;
}

std::optional<JobState> JobStore::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;

  std::lock_guard<std::mutex> entry_lock(it->second->mutex);
  return it->second->state;
}

bool JobStore::update(const std::string &id, const Mutator &mutator) {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end())
    return false;

  Entry &entry = *it->second;
  std::lock_guard<std::mutex> entry_lock(entry.mutex);
  if (is_terminal(entry.state.status))
    return false;

  JobState next = entry.state;
  mutator(next);

  next.id = entry.state.id;
  next.progress = std::clamp(next.progress, entry.state.progress, 1.0);
  if (is_terminal(next.status) && !next.finished_at)
    next.finished_at = Clock::now();

  entry.state = std::move(next);
  return true;
}

bool JobStore::erase(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  return entries_.erase(id) > 0;
}

size_t JobStore::evict_finished_before(Clock::time_point cutoff) {
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  size_t evicted = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    const JobState &s = it->second->state;
    if (is_terminal(s.status) && s.finished_at && *s.finished_at <= cutoff) {
      it = entries_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

size_t JobStore::size() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return entries_.size();
}

} // namespace media_jobs
