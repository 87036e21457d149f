/**
 * @file batch_monitor.hpp
 * @brief Tracks a set of submitted jobs until each has settled
 *
 * @details Used by the command-line client to follow a batch of
 *          submissions:
 *
 *          - poll() refreshes every pending job from the service
 *
 *          - the terminal snapshot is kept as soon as a job settles, so the
 *            summary does not depend on the job still being in the store
 *
 *          - a job that disappears before it was seen terminal (evicted by
 *            the retention sweep) settles as Evicted
 */

#ifndef MEDIA_JOBS_BATCH_MONITOR_HPP
#define MEDIA_JOBS_BATCH_MONITOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "transcode_service.hpp"

namespace media_jobs {

enum class BatchOutcome {
  Pending, //< Still running or queued
  Done,    //< Finished successfully
  Failed,  //< Finished in error
  Evicted  //< Gone from the store; outcome unknown
};

/**
 * @struct BatchEntry
 * @brief One tracked submission.
 */
struct BatchEntry {
  std::string job_id;
  std::string input; //< Source file name, for reporting
  BatchOutcome outcome = BatchOutcome::Pending;
  double last_progress = -1.0;
  std::optional<JobState> final_state; //< Set once Done or Failed
};

/**
 * @class BatchMonitor
 * @brief Polling bookkeeping over a TranscodeService.
 */
class BatchMonitor {
public:
  explicit BatchMonitor(const TranscodeService &service);

  void track(const std::string &job_id, const std::string &input);

  /**
   * @brief Refresh every pending job once.
   * @return Number of jobs still pending
   */
  size_t poll();

  bool all_settled() const { return pending_ == 0; }

  /// Jobs that did not finish successfully (Failed or Evicted)
  size_t unsuccessful() const;

  const std::vector<BatchEntry> &entries() const { return entries_; }

private:
  const TranscodeService &service_;
  std::vector<BatchEntry> entries_;
  size_t pending_ = 0;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_BATCH_MONITOR_HPP
