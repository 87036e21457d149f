/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Components receive these values through option structs, so the
 *          accessors below are only read when building defaults.
 *
 */

#ifndef MEDIA_JOBS_CONFIG_HPP
#define MEDIA_JOBS_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <string>

namespace media_jobs {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- EXTERNAL TOOLS ----**

/// Encoder binary, resolved through PATH when not absolute
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/// Inspection binary used for duration probing
inline const std::string &ffprobe_path() {
  static std::string val = get_env_string("FFPROBE_PATH", "ffprobe");
  return val;
}

/**
 * @brief Duration probing backend: "ffprobe" (default) or "libav"
 * @note "libav" probes in-process through libavformat and never spawns.
 */
inline const std::string &probe_backend() {
  static std::string val = get_env_string("PROBE_BACKEND", "ffprobe");
  return val;
}

/**
 * @brief Encode timeout in seconds (0 = no timeout)
 * @note A job hitting the timeout ends in Error with its own message.
 */
inline double encode_timeout_sec() {
  static double val = get_env_double("ENCODE_TIMEOUT_SEC", 0.0);
  return val;
}

// **---- JOB EXECUTION ----**

/**
 * @brief Number of concurrent encodes
 * @note 0 = auto-detect as half of the available CPUs (at least 1).
 *       Each ffmpeg process is itself multi-threaded.
 */
inline int max_concurrent_jobs() {
  static int val = get_env_int("MAX_CONCURRENT_JOBS", 0);
  return val;
}

/// Jobs allowed to wait for a worker before submissions are rejected
inline int job_queue_capacity() {
  static int val = get_env_int("JOB_QUEUE_CAPACITY", 64);
  return val;
}

/// Age after which finished jobs are evicted from the store
inline double job_retention_sec() {
  static double val = get_env_double("JOB_RETENTION_SEC", 3600.0);
  return val;
}

/// Period of the retention sweep
inline double job_sweep_interval_sec() {
  static double val = get_env_double("JOB_SWEEP_INTERVAL_SEC", 60.0);
  return val;
}

// **---- FILESYSTEM LAYOUT ----**

/// Directory holding staged (temporary) inputs
inline const std::string &staging_dir() {
  static std::string val = get_env_string(
      "STAGING_DIR", std::filesystem::temp_directory_path().string());
  return val;
}

/// Prefix of the result location reported for finished jobs
inline const std::string &output_url_prefix() {
  static std::string val = get_env_string("OUTPUT_URL_PREFIX", "/transcoded");
  return val;
}

/// Status polling period of the command-line client
inline int poll_interval_ms() {
  static int val = get_env_int("POLL_INTERVAL_MS", 500);
  return val;
}

} // namespace Config
} // namespace media_jobs

#endif // MEDIA_JOBS_CONFIG_HPP
