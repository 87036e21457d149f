/**
 * @file transcode_service.hpp
 * @brief Submission and status surface of the job manager
 *
 * @details The TranscodeService ties the pieces together:
 *
 *          - Submit: stage the payload, register the job as running, queue
 *            it and return the ID without waiting for the encode
 *
 *          - Status: snapshot of one job, or its JSON rendering
 *
 *          - Retention: a background sweep evicts finished jobs older than
 *            the retention window
 *
 * @note Transport (HTTP framing, multipart decoding) lives outside; callers
 *       hand over raw bytes or a local path plus the client filename.
 */

#ifndef MEDIA_JOBS_TRANSCODE_SERVICE_HPP
#define MEDIA_JOBS_TRANSCODE_SERVICE_HPP

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "job_runner.hpp"
#include "job_store.hpp"
#include "upload_staging.hpp"
#include "worker_pool.hpp"

namespace media_jobs {

/**
 * @struct ServiceOptions
 * @brief Layout, limits and tool settings of a service instance.
 */
struct ServiceOptions {
  std::string output_dir;                                  //< Produced MP4s
  std::string url_prefix = Config::output_url_prefix();    //< Result location
  std::string staging_dir = Config::staging_dir();         //< Temp inputs
  int max_concurrent_jobs = Config::max_concurrent_jobs(); //< 0 = auto
  size_t queue_capacity =
      static_cast<size_t>(std::max(1, Config::job_queue_capacity()));
  double retention_sec = Config::job_retention_sec();
  double sweep_interval_sec = Config::job_sweep_interval_sec();
  RunnerOptions runner;
};

enum class SubmitStatus {
  Accepted,   //< Job created and queued
  BadRequest, //< Missing or unreadable payload
  Overloaded  //< Queue full; nothing was created
};

/**
 * @struct SubmitResult
 * @brief Outcome of a submission.
 */
struct SubmitResult {
  SubmitStatus status = SubmitStatus::BadRequest;
  std::string job_id;  //< Set iff Accepted
  std::string message; //< Reason when not accepted
};

/**
 * @brief Client-facing rendering of a job.
 * @note {"status", "progress", "message"} always; "url" once done and
 *       "duration" when known.
 */
nlohmann::json job_to_json(const JobState &state);

/**
 * @class TranscodeService
 * @brief Owns the job store, the worker pool and the retention sweeper.
 */
class TranscodeService {
public:
  explicit TranscodeService(ServiceOptions options);
  ~TranscodeService();

  TranscodeService(const TranscodeService &) = delete;
  TranscodeService &operator=(const TranscodeService &) = delete;

  /**
   * @brief Submit raw file content.
   * @param payload File bytes
   * @param original_filename Client-side name (suffix hint only)
   * @param duration_hint Duration if already known
   */
  SubmitResult submit(const std::string &payload,
                      const std::string &original_filename,
                      std::optional<double> duration_hint = std::nullopt);

  /**
   * @brief Submit a local file; a copy is staged, the source is kept.
   */
  SubmitResult submit_file(const std::string &source_path,
                           const std::string &original_filename,
                           std::optional<double> duration_hint = std::nullopt);

  /**
   * @brief Snapshot of a job.
   * @return nullopt if the ID is unknown (nothing is created)
   */
  std::optional<JobState> status(const std::string &id) const;

  /**
   * @brief JSON snapshot of a job, serialized.
   * @return nullopt if the ID is unknown
   */
  std::optional<std::string> status_json(const std::string &id) const;

  /**
   * @brief Evict finished jobs older than the retention window now.
   * @return Number of evicted jobs
   */
  size_t sweep_expired();

  /**
   * @brief Stop the sweeper, drain the queue and join workers.
   * @note Idempotent; also called by the destructor.
   */
  void shutdown();

  size_t job_count() const { return store_.size(); }
  size_t queued() const { return pool_->queued(); }
  /// Jobs currently encoding
  int running() const { return pool_->active(); }
  int workers() const { return pool_->size(); }
  const ServiceOptions &options() const { return options_; }

private:
  /**
   * @brief Register and queue an already staged input.
   */
  SubmitResult enqueue(StagedFile staged,
                       std::optional<double> duration_hint);

  void sweeper_loop();

  ServiceOptions options_;
  JobStore store_;
  UploadStager stager_;
  JobRunner runner_;
  std::unique_ptr<WorkerPool> pool_;

  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;
  bool stopping_ = false;
  std::thread sweeper_;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_TRANSCODE_SERVICE_HPP
