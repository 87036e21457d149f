/**
 * @file subprocess.hpp
 * @brief External tool execution with streamed stdout and bounded stderr
 *
 * @details Spawns ffmpeg/ffprobe with posix_spawnp and exposes:
 *
 *          - stdout as a lazy, finite, non-restartable line sequence
 *
 *          - the trailing window of stderr (diagnostic tail)
 *
 *          - the exit status, optionally bounded by a deadline
 *
 * @note Both pipes are drained together with poll(), so a tool that writes a
 *       lot to stderr cannot stall while we wait on stdout.
 */

#ifndef MEDIA_JOBS_SUBPROCESS_HPP
#define MEDIA_JOBS_SUBPROCESS_HPP

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "types.hpp"

namespace media_jobs {

/**
 * @class Subprocess
 * @brief One external process and the two pipes attached to it.
 *
 * @attention USAGE:
 *
 *   - start() with the full argv (argv[0] is looked up in PATH)
 *
 *   - next_line() until it returns false, or read_all()
 *
 *   - wait() for the exit code; the remaining output is drained first
 *
 * @note The destructor kills and reaps a child that was never waited for.
 */
class Subprocess {
public:
  enum class StartStatus {
    Started,  //< Child is running
    NotFound, //< Binary missing or not executable
    Failed    //< Pipe or spawn failure unrelated to the binary
  };

  explicit Subprocess(size_t tail_limit = DIAGNOSTIC_TAIL_BYTES);
  ~Subprocess();

  /// Disable copy
  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Spawn the process.
   * @param argv Program followed by its arguments
   * @return Spawn outcome; errno text is kept in start_error()
   */
  StartStatus start(const std::vector<std::string> &argv);

  /**
   * @brief Stop reading once this much wall time has passed.
   * @note When hit, next_line()/read_all() stop and timed_out() turns true;
   *       wait() then kills the child.
   */
  void set_timeout(double seconds);

  /**
   * @brief Next stdout line, without the trailing newline.
   * @param line Output: the line
   * @return false once stdout is closed and fully consumed (or timed out)
   */
  bool next_line(std::string &line);

  /**
   * @brief Consume stdout until EOF.
   * @return Everything not already returned by next_line()
   */
  std::string read_all();

  /**
   * @brief Drain remaining output, then reap the child.
   * @return Exit code; 128 + signal number if killed by a signal;
   *         -1 if the process was never started
   */
  int wait();

  /// Send SIGKILL to a running child
  void kill();

  bool running() const { return pid_ > 0 && !reaped_; }
  bool timed_out() const { return timed_out_; }
  pid_t pid() const { return pid_; }

  /// Trailing window of everything written to stderr
  const std::string &error_tail() const { return err_tail_; }

  /// strerror() text of the last failed start()
  const std::string &start_error() const { return start_error_; }

private:
  /**
   * @brief Wait for data on the open pipes and read what is available.
   * @return false on deadline expiry or when no pipe is left open
   */
  bool pump();

  void append_tail(const char *data, size_t n);
  void close_pipes();

  size_t tail_limit_;
  pid_t pid_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;
  int out_fd_ = -1;
  int err_fd_ = -1;
  std::string out_buf_;
  std::string err_tail_;
  std::string start_error_;
  std::optional<Clock::time_point> deadline_;
  bool timed_out_ = false;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_SUBPROCESS_HPP
