/**
 * @file logging.cpp
 * @brief Log mutex and phase timing statistics
 */

#include "media_jobs/logging.hpp"

#include <algorithm>

namespace media_jobs {

std::mutex log_mutex;

std::mutex TimingCollector::timing_mutex;
std::map<std::string, PhaseStats> TimingCollector::phases;

void TimingCollector::record(const std::string &phase, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  PhaseStats &s = phases[phase];
  s.count++;
  s.total_us += us;
  s.max_us = std::max(s.max_us, us);
}

std::optional<PhaseStats> TimingCollector::stats(const std::string &phase) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = phases.find(phase);
  if (it == phases.end())
    return std::nullopt;
  return it->second;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (phases.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "================= PHASE TIMINGS ==================\n");
  fmt::print(stderr, "{:<10} {:>6} {:>10} {:>10} {:>10}\n", "Phase", "Jobs",
             "Total [s]", "Mean [s]", "Max [s]");
  fmt::print(stderr, "{:-<10} {:->6} {:->10} {:->10} {:->10}\n", "", "", "",
             "", "");
  for (const auto &[name, s] : phases) {
    double mean = s.count ? s.total_us / 1e6 / s.count : 0.0;
    fmt::print(stderr, "{:<10} {:>6} {:>10.2f} {:>10.2f} {:>10.2f}\n", name,
               s.count, s.total_us / 1e6, mean, s.max_us / 1e6);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "==================================================\n");
  std::fflush(stderr);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  phases.clear();
}

} // namespace media_jobs
