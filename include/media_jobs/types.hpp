/**
 * @file types.hpp
 * @brief Core data types and constants for Media Jobs
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Diagnostic and output naming constants
 *
 *          - JobStatus and JobState for tracked transcodes
 *
 *          - JobTicket for work queue items
 */

#ifndef MEDIA_JOBS_TYPES_HPP
#define MEDIA_JOBS_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace media_jobs {

// **----- CONSTANTS -----**

/**
 * @brief Maximum number of bytes kept from an external tool's stderr.
 * @note Only the trailing window is retained; this is what ends up in a
 *       failed job's message.
 */
constexpr size_t DIAGNOSTIC_TAIL_BYTES = 4000;

/// Extension of every produced artifact (H.264/AAC in MP4)
constexpr const char *OUTPUT_EXTENSION = ".mp4";

using Clock = std::chrono::steady_clock;

// **----- DATA STRUCTURES -----**

/**
 * @brief Lifecycle of a job. Done and Error are terminal.
 */
enum class JobStatus { Running, Done, Error };

/// Lowercase wire name ("running", "done", "error")
const char *to_string(JobStatus status);

inline bool is_terminal(JobStatus status) {
  return status != JobStatus::Running;
}

/**
 * @struct JobState
 * @brief Tracked state of one submitted transcode.
 * @note Copies of this struct are what status readers get; the live record
 *       only exists inside JobStore.
 */
struct JobState {
  std::string id;                         //< 32-char hex token, map key
  JobStatus status = JobStatus::Running;  //< Current lifecycle state
  double progress = 0.0;                  //< Completion fraction [0, 1]
  std::string message;                    //< Diagnostic, set on Error
  std::optional<std::string> result_url;  //< Output location, set on Done
  std::optional<double> duration_seconds; //< Known or probed duration
  Clock::time_point created_at{};         //< Submission time
  std::optional<Clock::time_point> finished_at; //< Time of terminal transition
};

/**
 * @struct JobTicket
 * @brief A unit of work for the job queue.
 * @note Owns nothing; the staged input is adopted by the runner.
 */
struct JobTicket {
  std::string id;                      //< Job identifier in the store
  std::string input_path;              //< Staged temporary input
  std::string output_path;             //< Absolute output path
  std::string result_url;              //< Location reported once Done
  std::optional<double> duration_hint; //< Duration known at submission
};

} // namespace media_jobs

#endif // MEDIA_JOBS_TYPES_HPP
