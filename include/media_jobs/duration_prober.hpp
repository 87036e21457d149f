/**
 * @file duration_prober.hpp
 * @brief Best-effort media duration probing
 *
 * @details Two backends:
 *
 *          - FFprobe: runs `ffprobe -print_format json -show_format
 *            -show_streams` and reads `format.duration`, falling back to the
 *            longest `streams[].duration`
 *
 *          - Libav: opens the file in-process with libavformat
 *
 * @note A missing duration is never an error for a job; it only switches
 *       progress reporting to the heuristic.
 */

#ifndef MEDIA_JOBS_DURATION_PROBER_HPP
#define MEDIA_JOBS_DURATION_PROBER_HPP

#include <optional>
#include <string>

#include "config.hpp"

namespace media_jobs {

enum class ProbeBackend { FFprobe, Libav };

/// "libav" selects Libav, anything else FFprobe
ProbeBackend parse_probe_backend(const std::string &name);

/**
 * @struct ProbeOptions
 * @brief Which backend and which binary to use.
 */
struct ProbeOptions {
  std::string ffprobe_path = Config::ffprobe_path();
  ProbeBackend backend = parse_probe_backend(Config::probe_backend());
};

enum class ProbeStatus {
  Ok,           //< Duration found
  ToolNotFound, //< ffprobe missing
  ProbeFailed,  //< Tool failed or printed garbage
  NoDuration    //< Parsed fine, but no duration anywhere
};

/**
 * @struct ProbeReport
 * @brief Detailed probe outcome for callers that report failures.
 */
struct ProbeReport {
  ProbeStatus status = ProbeStatus::ProbeFailed;
  std::optional<double> duration; //< Seconds, set iff status == Ok
  std::string diagnostic;         //< Bounded failure description
};

/**
 * @brief Acceptance rule shared by both backends.
 * @return seconds if finite and non-negative, else nullopt
 */
std::optional<double> usable_duration(double seconds);

/**
 * @brief Extract a duration from ffprobe's JSON output.
 * @param json_text Raw stdout of ffprobe
 * @return Seconds, or nullopt if the text is not JSON or has no usable
 *         duration
 */
std::optional<double> parse_probe_output(const std::string &json_text);

/**
 * @brief Probe a file and report exactly what went wrong, if anything.
 */
ProbeReport probe_media(const std::string &path,
                        const ProbeOptions &options = ProbeOptions{});

/**
 * @brief Probe a file for its duration.
 * @return Seconds, or nullopt ("unknown") on any failure
 */
std::optional<double> probe_duration(const std::string &path,
                                     const ProbeOptions &options = ProbeOptions{});

} // namespace media_jobs

#endif // MEDIA_JOBS_DURATION_PROBER_HPP
