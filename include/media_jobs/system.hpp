/**
 * @file system.hpp
 * @brief System utilities, CPU detection and identifier generation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker pool sizing
 *
 *          - Random tokens for job IDs and output names
 *
 *          - Time formatting utilities
 */

#ifndef MEDIA_JOBS_SYSTEM_HPP
#define MEDIA_JOBS_SYSTEM_HPP

#include <string>

namespace media_jobs {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Calculate the number of concurrent encodes.
 *
 * @note ffmpeg/x264 already spreads one encode over several cores, so auto
 *       mode runs half as many encodes as there are CPUs.
 *
 * @param configured Requested worker count (0 = auto)
 * @return min(configured, available CPUs), or max(1, available / 2) in auto
 *         mode
 */
int calculate_worker_count(int configured);

// **---- Identifiers ----**

/**
 * @brief 128-bit random token as 32 lowercase hex characters.
 * @note Used for job IDs and output file names.
 */
std::string generate_token();

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace media_jobs

#endif // MEDIA_JOBS_SYSTEM_HPP
