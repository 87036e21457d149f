/**
 * @file job_runner.cpp
 * @brief Job execution implementation
 *
 * @details Every log line is prefixed with [Job <first 8 chars of id>].
 */

#include "media_jobs/job_runner.hpp"

#include <algorithm>
#include <exception>

#include <fmt/core.h>

#include "media_jobs/logging.hpp"
#include "media_jobs/progress_parser.hpp"
#include "media_jobs/system.hpp"
#include "media_jobs/upload_staging.hpp"

namespace media_jobs {

namespace {

std::string short_id(const std::string &id) { return id.substr(0, 8); }

/// Keep the trailing window only
std::string bounded(const std::string &message) {
  if (message.size() <= DIAGNOSTIC_TAIL_BYTES)
    return message;
  return message.substr(message.size() - DIAGNOSTIC_TAIL_BYTES);
}

} // anonymous namespace

JobRunner::JobRunner(JobStore &store, RunnerOptions options)
    : store_(store), options_(std::move(options)) {}

void JobRunner::run(const JobTicket &ticket) {
  /// Released on every exit path below, including exceptions
  StagedFile input(ticket.input_path);

  try {
    TIMER_START(probe);
    auto duration = resolve_duration(ticket);
    TIMER_END(probe);

    TIMER_START(encode);
    encode(ticket, duration);
    TIMER_END(encode);
  } catch (const std::exception &e) {
    LOG_ERROR("[Job {}] Unexpected failure: {}", short_id(ticket.id),
              e.what());
    mark_error(ticket.id, fmt::format("internal error: {}", e.what()));
  }
}

std::optional<double> JobRunner::resolve_duration(const JobTicket &ticket) {
  if (ticket.duration_hint)
    return ticket.duration_hint;

  auto duration = probe_duration(ticket.input_path, options_.probe);
  if (duration) {
    LOG_INFO("[Job {}] Duration: {}", short_id(ticket.id),
             format_time(*duration));
    store_.update(ticket.id,
                  [&](JobState &s) { s.duration_seconds = duration; });
  } else {
    LOG_WARN("[Job {}] Duration unknown, using heuristic progress",
             short_id(ticket.id));
  }
  return duration;
}

void JobRunner::encode(const JobTicket &ticket,
                       std::optional<double> duration) {
  ProgressParser parser(duration);

  auto on_line = [&](const std::string &line) {
    if (auto fraction = parser.feed(line)) {
      /// 1.0 is only reported once the encoder has exited cleanly
      double shown = std::min(*fraction, PENDING_PROGRESS_CAP);
      store_.update(ticket.id, [shown](JobState &s) { s.progress = shown; });
    }
    return !parser.finished();
  };

  EncodeResult result =
      options_.encode(ticket.input_path, ticket.output_path, options_.encoder,
                      on_line, short_id(ticket.id));

  switch (result.status) {
  case EncodeStatus::Success:
    store_.update(ticket.id, [&](JobState &s) {
      s.status = JobStatus::Done;
      s.progress = 1.0;
      s.result_url = ticket.result_url;
    });
    LOG_SUCCESS("[Job {}] Done -> {}", short_id(ticket.id), ticket.result_url);
    break;
  case EncodeStatus::ToolNotFound:
  case EncodeStatus::EncodeFailed:
  case EncodeStatus::TimedOut:
    mark_error(ticket.id, result.diagnostic);
    break;
  }
}

void JobRunner::mark_error(const std::string &id, const std::string &message) {
  std::string text = message.empty() ? "transcode failed" : bounded(message);
  store_.update(id, [&](JobState &s) {
    s.status = JobStatus::Error;
    s.message = text;
    s.result_url.reset();
  });
}

} // namespace media_jobs
