/**
 * @file job_store.hpp
 * @brief Concurrency-safe registry of job states
 *
 * @details The only state shared between the submitting path, the status
 *          readers and the job runners. The map itself is never exposed;
 *          callers get snapshot copies or go through update().
 */

#ifndef MEDIA_JOBS_JOB_STORE_HPP
#define MEDIA_JOBS_JOB_STORE_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace media_jobs {

/**
 * @class JobStore
 * @brief Map from job ID to JobState with atomic per-entry updates.
 *
 * @attention LOCKING:
 *
 *   - map_mutex_ (shared) guards the map shape: taken exclusively only by
 *     create/erase/evict
 *
 *   - each entry has its own mutex, so updates to different jobs proceed in
 *     parallel and get/update on one job are linearizable
 *
 * @note Entries in a terminal state are frozen: update() refuses them.
 */
class JobStore {
public:
  using Mutator = std::function<void(JobState &)>;

  /**
   * @brief Insert a new entry.
   * @return false if the ID is already present
   */
  bool create(JobState initial);

  /**
   * @brief Snapshot of one job.
   * @return A copy, or nullopt if the ID is unknown
   */
  std::optional<JobState> get(const std::string &id) const;

  /**
   * @brief Atomic read-modify-write of one entry.
   *
   * @details After the mutator runs the store restores the ID, keeps
   *          progress inside [previous, 1] and stamps finished_at on the
   *          transition into a terminal state.
   *
   * @return false if the ID is unknown or the job is already terminal
   */
  bool update(const std::string &id, const Mutator &mutator);

  /**
   * @brief Drop an entry that never got scheduled.
   * @return true if something was removed
   */
  bool erase(const std::string &id);

  /**
   * @brief Remove terminal jobs that finished at or before cutoff.
   * @return Number of evicted jobs
   */
  size_t evict_finished_before(Clock::time_point cutoff);

  size_t size() const;

private:
  struct Entry {
    mutable std::mutex mutex;
    JobState state;
  };

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_JOB_STORE_HPP
