/**
 * @file progress_parser.hpp
 * @brief Converts ffmpeg `-progress` output into a completion fraction
 *
 * @details ffmpeg writes key=value blocks terminated by `progress=continue`
 *          or `progress=end`. Only `out_time_ms` (microseconds, despite the
 *          name) counts as a marker. Each block carries exactly one, so the
 *          heuristic advances once per block; `out_time_us` and `out_time`
 *          repeat the same value and are ignored like every other key. A malformed value (ffmpeg prints
 *          `N/A` before the first frame) is skipped.
 */

#ifndef MEDIA_JOBS_PROGRESS_PARSER_HPP
#define MEDIA_JOBS_PROGRESS_PARSER_HPP

#include <optional>
#include <string>

namespace media_jobs {

/// Step added per marker when the total duration is unknown
constexpr double UNKNOWN_DURATION_STEP = 0.01;

/// Highest fraction reported before the encoder has exited successfully
constexpr double PENDING_PROGRESS_CAP = 0.99;

/**
 * @class ProgressParser
 * @brief Stateful line consumer for one encode.
 *
 * @attention The reported fraction never decreases:
 *
 *   - known duration: clamp(elapsed / duration, 0, 1)
 *
 *   - unknown duration: previous + UNKNOWN_DURATION_STEP, capped at
 *     PENDING_PROGRESS_CAP
 */
class ProgressParser {
public:
  /**
   * @param duration_seconds Total media duration; unset or <= 0 selects the
   *                         heuristic
   */
  explicit ProgressParser(std::optional<double> duration_seconds);

  /**
   * @brief Consume one output line.
   * @return The updated fraction if the line was a valid progress marker
   */
  std::optional<double> feed(const std::string &line);

  /// True once `progress=end` has been seen
  bool finished() const { return finished_; }

  /// Last reported fraction (0 before any marker)
  double fraction() const { return fraction_; }

  /// Elapsed encoded time of the last valid marker, in seconds
  double elapsed_seconds() const { return elapsed_sec_; }

  bool has_duration() const { return duration_.has_value(); }

  /**
   * @brief Extract the elapsed time from a single marker line.
   * @return Seconds, or nullopt for non-markers and malformed values
   */
  static std::optional<double> parse_elapsed_seconds(const std::string &line);

private:
  std::optional<double> duration_;
  double fraction_ = 0.0;
  double elapsed_sec_ = 0.0;
  bool finished_ = false;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_PROGRESS_PARSER_HPP
