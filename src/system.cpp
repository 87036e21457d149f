/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "media_jobs/system.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace media_jobs {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Count CPUs in a cpuset string like "0,2,4,6,8" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);
    size_t dash = item.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int first = std::stoi(item.substr(0, dash));
        int last = std::stoi(item.substr(dash + 1));
        if (last >= first)
          count += last - first + 1;
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = end + 1;
  }
  return count > 0 ? count : -1;
}

/// Helper to count CPUs from cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0) {
            limit = static_cast<int>((quota + period - 1) / period);
          }
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_worker_count(int configured) {
  int available = detect_cpu_limit();

  /// Auto-detect: one encode per two CPUs
  if (configured <= 0) {
    return std::max(1, available / 2);
  }

  /// User configured: take minimum of configured and available
  return std::max(1, std::min(configured, available));
}

// **---- Identifiers ----**

std::string generate_token() {
  thread_local std::mt19937_64 rng{[] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }()};

  uint64_t hi = rng();
  uint64_t lo = rng();
  return fmt::format("{:016x}{:016x}", hi, lo);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace media_jobs
