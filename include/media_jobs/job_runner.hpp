/**
 * @file job_runner.hpp
 * @brief End-to-end execution of one transcode job
 *
 * @details The JobRunner drives a single job through:
 *
 *          1. Adopt the staged input (deleted when the runner returns)
 *
 *          2. Resolve the duration (hint or probe)
 *
 *          3. Run ffmpeg, pushing progress into the JobStore
 *
 *          4. Record the terminal state (Done or Error)
 *
 * @note Only the runner that owns a job writes its progress; the store is
 *       the single place status readers look at.
 */

#ifndef MEDIA_JOBS_JOB_RUNNER_HPP
#define MEDIA_JOBS_JOB_RUNNER_HPP

#include <optional>
#include <string>

#include "duration_prober.hpp"
#include "ffmpeg_executor.hpp"
#include "job_store.hpp"
#include "types.hpp"

namespace media_jobs {

/**
 * @struct RunnerOptions
 * @brief Tool settings shared by every job a runner executes.
 */
struct RunnerOptions {
  ProbeOptions probe;
  EncoderOptions encoder;
  EncodeFunction encode = execute_ffmpeg_transcode; //< Encoder entry point
};

/**
 * @class JobRunner
 * @brief Runs jobs against a JobStore.
 *
 * @attention WORKFLOW:
 *
 * 1. Take ownership of the temporary input
 *
 * 2. Probe the duration unless the ticket carries one
 *
 * 3. Encode, mapping each progress marker to a store update
 *
 * 4. ToolNotFound / EncodeFailed / TimedOut -> Error, exit 0 -> Done
 *
 * 5. Delete the temporary input on every path
 */
class JobRunner {
public:
  JobRunner(JobStore &store, RunnerOptions options);

  /**
   * @brief Run one job to a terminal state.
   * @note Blocks for the whole encode. Never throws; unexpected failures
   *       end the job in Error.
   */
  void run(const JobTicket &ticket);

private:
  /**
   * @brief Probe (or accept) the duration and store it on the job.
   */
  std::optional<double> resolve_duration(const JobTicket &ticket);

  /**
   * @brief Encode and translate the outcome into the job's terminal state.
   */
  void encode(const JobTicket &ticket, std::optional<double> duration);

  void mark_error(const std::string &id, const std::string &message);

  JobStore &store_;
  RunnerOptions options_;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_JOB_RUNNER_HPP
