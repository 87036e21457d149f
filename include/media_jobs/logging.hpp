/**
 * @file logging.hpp
 * @brief Logging macros and phase timing statistics
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Phase timing macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector: per-phase aggregates (count, total, max)
 *
 * @note Logs go to stderr; stdout is reserved for command output such as
 *       `media_jobs probe` JSON. Worker threads log concurrently, so every
 *       line is written under log_mutex.
 */

#ifndef MEDIA_JOBS_LOGGING_HPP
#define MEDIA_JOBS_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_jobs {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define MEDIA_JOBS_LOG_LINE(...)                                               \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_jobs::log_mutex);                   \
    fmt::print(stderr, __VA_ARGS__);                                           \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  MEDIA_JOBS_LOG_LINE("[INFO] " format_str "\n", ##__VA_ARGS__)

#define LOG_WARN(format_str, ...)                                              \
  MEDIA_JOBS_LOG_LINE(fg(fmt::color::yellow), "[WARN] " format_str "\n",       \
                      ##__VA_ARGS__)

#define LOG_ERROR(format_str, ...)                                             \
  MEDIA_JOBS_LOG_LINE(fg(fmt::color::red), "[ERROR] " format_str "\n",         \
                      ##__VA_ARGS__)

#define LOG_PHASE(format_str, ...)                                             \
  MEDIA_JOBS_LOG_LINE(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__)

#define LOG_SUCCESS(format_str, ...)                                           \
  MEDIA_JOBS_LOG_LINE(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief PhaseStats: aggregate over every recorded run of one phase.
 */
struct PhaseStats {
  size_t count = 0;
  long total_us = 0;
  long max_us = 0;
};

/**
 * @class TimingCollector
 * @brief Process-wide phase statistics ("probe", "encode").
 * @note Aggregates instead of keeping one entry per job, so a long-running
 *       service does not accumulate memory here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, PhaseStats> phases;

public:
  /**
   * @brief Add one run of a phase.
   * @param phase Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &phase, long us);

  /// Aggregate for one phase, nullopt if never recorded
  static std::optional<PhaseStats> stats(const std::string &phase);

  /**
   * @brief Print count, total, mean and max per phase.
   */
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  media_jobs::TimingCollector::record(                                         \
      #name, static_cast<long>(                                                \
                 std::chrono::duration_cast<std::chrono::microseconds>(        \
                     std::chrono::steady_clock::now() - timer_start_##name)    \
                     .count()))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace media_jobs

#endif // MEDIA_JOBS_LOGGING_HPP
