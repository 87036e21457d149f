/**
 * @file transcode_service.cpp
 * @brief Submission/status surface implementation
 */

#include "media_jobs/transcode_service.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "media_jobs/logging.hpp"
#include "media_jobs/system.hpp"

namespace media_jobs {

namespace fs = std::filesystem;

namespace {

/// ID collisions are astronomically unlikely; retry a few times anyway
constexpr int MAX_ID_ATTEMPTS = 4;

Clock::duration seconds_to_duration(double seconds) {
  return std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(seconds));
}

} // anonymous namespace

nlohmann::json job_to_json(const JobState &state) {
  nlohmann::json j = {{"status", to_string(state.status)},
                      {"progress", state.progress},
                      {"message", state.message}};
  if (state.result_url)
    j["url"] = *state.result_url;
  if (state.duration_seconds)
    j["duration"] = *state.duration_seconds;
  return j;
}

TranscodeService::TranscodeService(ServiceOptions options)
    : options_(std::move(options)), stager_(options_.staging_dir),
      runner_(store_, options_.runner) {
  std::error_code ec;
  fs::create_directories(options_.output_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}", options_.output_dir,
              ec.message());
  }

  int workers = calculate_worker_count(options_.max_concurrent_jobs);
  pool_ = std::make_unique<WorkerPool>(runner_, workers,
                                       options_.queue_capacity);

  if (options_.sweep_interval_sec > 0) {
    sweeper_ = std::thread(&TranscodeService::sweeper_loop, this);
  }
}

TranscodeService::~TranscodeService() { shutdown(); }

SubmitResult TranscodeService::submit(const std::string &payload,
                                      const std::string &original_filename,
                                      std::optional<double> duration_hint) {
  std::string error;
  StagedFile staged = stager_.stage_bytes(payload, original_filename, error);
  if (!staged.is_valid()) {
    LOG_WARN("Rejected submission '{}': {}", original_filename, error);
    return {SubmitStatus::BadRequest, "", error};
  }
  return enqueue(std::move(staged), duration_hint);
}

SubmitResult TranscodeService::submit_file(const std::string &source_path,
                                           const std::string &original_filename,
                                           std::optional<double> duration_hint) {
  std::string error;
  StagedFile staged =
      stager_.stage_copy(source_path, original_filename, error);
  if (!staged.is_valid()) {
    LOG_WARN("Rejected submission '{}': {}", source_path, error);
    return {SubmitStatus::BadRequest, "", error};
  }
  return enqueue(std::move(staged), duration_hint);
}

SubmitResult TranscodeService::enqueue(StagedFile staged,
                                       std::optional<double> duration_hint) {
  JobState state;
  state.status = JobStatus::Running;
  state.created_at = Clock::now();
  if (duration_hint && *duration_hint > 0)
    state.duration_seconds = duration_hint;

  bool created = false;
  for (int attempt = 0; attempt < MAX_ID_ATTEMPTS && !created; ++attempt) {
    state.id = generate_token();
    created = store_.create(state);
  }
  if (!created) {
    return {SubmitStatus::BadRequest, "", "could not allocate a job id"};
  }

  std::string out_name = generate_token() + OUTPUT_EXTENSION;

  JobTicket ticket;
  ticket.id = state.id;
  ticket.input_path = staged.path();
  ticket.output_path = (fs::path(options_.output_dir) / out_name).string();
  ticket.result_url = fmt::format("{}/{}", options_.url_prefix, out_name);
  ticket.duration_hint = state.duration_seconds;

  if (!pool_->submit(ticket)) {
    /// Never scheduled: roll back; the staged input goes with `staged`
    store_.erase(state.id);
    LOG_WARN("Queue full ({} waiting), submission rejected", pool_->queued());
    return {SubmitStatus::Overloaded, "", "server overloaded, try again later"};
  }

  /// The runner owns the input from here on
  staged.release();
  LOG_INFO("[Job {}] Queued -> {}", state.id.substr(0, 8), out_name);
  return {SubmitStatus::Accepted, state.id, ""};
}

std::optional<JobState> TranscodeService::status(const std::string &id) const {
  return store_.get(id);
}

std::optional<std::string>
TranscodeService::status_json(const std::string &id) const {
  auto state = store_.get(id);
  if (!state)
    return std::nullopt;
  return job_to_json(*state).dump();
}

size_t TranscodeService::sweep_expired() {
  auto cutoff = Clock::now() - seconds_to_duration(options_.retention_sec);
  size_t evicted = store_.evict_finished_before(cutoff);
  if (evicted > 0) {
    LOG_INFO("Evicted {} finished jobs ({} remain)", evicted, store_.size());
  }
  return evicted;
}

void TranscodeService::sweeper_loop() {
  auto interval = seconds_to_duration(options_.sweep_interval_sec);
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (!stopping_) {
    if (sweep_cv_.wait_for(lock, interval, [this] { return stopping_; }))
      break;
    lock.unlock();
    sweep_expired();
    lock.lock();
  }
}

void TranscodeService::shutdown() {
  {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    stopping_ = true;
  }
  sweep_cv_.notify_all();
  if (sweeper_.joinable())
    sweeper_.join();

  if (pool_)
    pool_->shutdown();
}

} // namespace media_jobs
