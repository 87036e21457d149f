/**
 * @file batch_monitor.cpp
 * @brief Batch polling implementation
 */

#include "media_jobs/batch_monitor.hpp"

#include <algorithm>

#include "media_jobs/logging.hpp"

namespace media_jobs {

BatchMonitor::BatchMonitor(const TranscodeService &service)
    : service_(service) {}

void BatchMonitor::track(const std::string &job_id, const std::string &input) {
  BatchEntry entry;
  entry.job_id = job_id;
  entry.input = input;
  entries_.push_back(std::move(entry));
  ++pending_;
}

size_t BatchMonitor::poll() {
  for (auto &e : entries_) {
    if (e.outcome != BatchOutcome::Pending)
      continue;

    auto state = service_.status(e.job_id);
    if (!state) {
      LOG_WARN("[Job {}] {} vanished before completion was observed",
               e.job_id.substr(0, 8), e.input);
      e.outcome = BatchOutcome::Evicted;
      --pending_;
      continue;
    }

    if (state->status == JobStatus::Running) {
      if (state->progress != e.last_progress) {
        LOG_INFO("[Job {}] {} {:5.1f}%", e.job_id.substr(0, 8), e.input,
                 state->progress * 100.0);
        e.last_progress = state->progress;
      }
      continue;
    }

    e.outcome = state->status == JobStatus::Done ? BatchOutcome::Done
                                                 : BatchOutcome::Failed;
    e.final_state = std::move(state);
    --pending_;
  }
  return pending_;
}

size_t BatchMonitor::unsuccessful() const {
  return static_cast<size_t>(
      std::count_if(entries_.begin(), entries_.end(), [](const BatchEntry &e) {
        return e.outcome == BatchOutcome::Failed ||
               e.outcome == BatchOutcome::Evicted;
      }));
}

} // namespace media_jobs
