/**
 * @file main.cpp
 * @brief Entry point for the media_jobs command-line client
 *
 * @details Main entry point that handles:
 *
 *          - `probe <file>`: print the media duration as JSON
 *
 *          - `<input> <output_dir>`: submit one file (or every video in a
 *            directory) as asynchronous transcode jobs, poll their status
 *            until all are finished and print a summary
 *
 * @note Submitted files are copied into the staging directory first; the
 *       originals are never modified or deleted.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "media_jobs/batch_monitor.hpp"
#include "media_jobs/config.hpp"
#include "media_jobs/duration_prober.hpp"
#include "media_jobs/logging.hpp"
#include "media_jobs/system.hpp"
#include "media_jobs/transcode_service.hpp"

using namespace media_jobs;

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_PROBE_FAILED = 2;
constexpr int EXIT_TOOL_MISSING = 3;

bool is_video_file(const fs::path &p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
         ext == ".avi" || ext == ".webm" || ext == ".m4v";
}

// **---- PROBE COMMAND ----**

int run_probe(const std::string &path) {
  ProbeReport report = probe_media(path);
  switch (report.status) {
  case ProbeStatus::Ok:
    fmt::print("{}\n", nlohmann::json{{"duration", *report.duration}}.dump());
    return 0;
  case ProbeStatus::ToolNotFound:
    LOG_ERROR("{}", report.diagnostic);
    return EXIT_TOOL_MISSING;
  case ProbeStatus::ProbeFailed:
  case ProbeStatus::NoDuration:
    fmt::print("{}\n", nlohmann::json{{"error", "ffprobe_failed"},
                                      {"message", report.diagnostic}}
                           .dump());
    return EXIT_PROBE_FAILED;
  }
  return EXIT_PROBE_FAILED;
}

// **---- TRANSCODE COMMAND ----**

int run_transcode(const std::vector<std::string> &files,
                  const std::string &output_dir) {
  ServiceOptions options;
  options.output_dir = output_dir;
  TranscodeService service(std::move(options));

  LOG_PHASE("==================== TRANSCODE ====================");
  LOG_INFO("Files: {}", files.size());
  LOG_INFO("Concurrent encodes: {}", service.workers());
  LOG_INFO("Output directory: {}", output_dir);
  LOG_PHASE("===================================================");

  auto batch_start = std::chrono::steady_clock::now();

  BatchMonitor monitor(service);
  int rejected = 0;
  size_t next = 0;
  auto poll_interval = std::chrono::milliseconds(Config::poll_interval_ms());

  /// Submit as long as the queue has room, then poll until all have settled
  while (next < files.size() || !monitor.all_settled()) {
    while (next < files.size()) {
      const std::string &file = files[next];
      std::string name = fs::path(file).filename().string();
      SubmitResult r = service.submit_file(file, name);
      if (r.status == SubmitStatus::Overloaded)
        break;
      ++next;
      if (r.status != SubmitStatus::Accepted) {
        LOG_ERROR("Cannot submit {}: {}", file, r.message);
        ++rejected;
        continue;
      }
      monitor.track(r.job_id, name);
    }

    std::this_thread::sleep_for(poll_interval);
    size_t pending = monitor.poll();
    if (pending > 0) {
      LOG_INFO("{} encoding, {} queued, {} pending", service.running(),
               service.queued(), pending);
    }
  }

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();

  // **---- SUMMARY ----**

  LOG_PHASE("===================== SUMMARY =====================");
  for (const auto &e : monitor.entries()) {
    switch (e.outcome) {
    case BatchOutcome::Done: {
      const std::string &url = *e.final_state->result_url;
      std::string out_name = fs::path(url).filename().string();
      auto out_duration =
          probe_duration((fs::path(output_dir) / out_name).string());
      LOG_SUCCESS("{} -> {} ({})", e.input, url,
                  out_duration ? format_time(*out_duration) : "duration n/a");
      break;
    }
    case BatchOutcome::Failed:
      LOG_ERROR("{} failed: {}", e.input, e.final_state->message);
      break;
    case BatchOutcome::Evicted:
    case BatchOutcome::Pending:
      LOG_WARN("{}: outcome unknown (job {} no longer tracked)", e.input,
               e.job_id.substr(0, 8));
      break;
    }
  }
  LOG_INFO("Wall clock: {}", format_time(elapsed_sec));
  LOG_PHASE("===================================================");

  service.shutdown();
  TimingCollector::print_summary();
  return rejected + static_cast<int>(monitor.unsuccessful());
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc == 3 && std::string(argv[1]) == "probe") {
    return run_probe(argv[2]);
  }

  if (argc < 3) {
    LOG_WARN("Usage: ./media_jobs probe <file>");
    LOG_WARN("       ./media_jobs <input file|dir> <output_dir>");
    return 1;
  }

  std::string input_arg = argv[1];
  std::string output_arg = argv[2];

  std::vector<std::string> files;
  if (fs::is_directory(input_arg)) {
    for (const auto &entry : fs::directory_iterator(input_arg)) {
      if (entry.is_regular_file() && is_video_file(entry.path())) {
        files.push_back(entry.path().string());
      }
    }
    std::sort(files.begin(), files.end());
  } else if (fs::is_regular_file(input_arg)) {
    files.push_back(input_arg);
  }

  if (files.empty()) {
    LOG_WARN("No video files found in {}", input_arg);
    return 0;
  }

  return run_transcode(files, output_arg);
}
