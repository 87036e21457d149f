/**
 * @file duration_prober.cpp
 * @brief Duration probing implementation (ffprobe and libavformat)
 */

#include "media_jobs/duration_prober.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include "media_jobs/logging.hpp"
#include "media_jobs/subprocess.hpp"

namespace media_jobs {

using json = nlohmann::json;

namespace {

/// ffprobe prints durations as strings ("12.345000"); accept numbers too
std::optional<double> read_duration_field(const json &obj) {
  if (!obj.is_object())
    return std::nullopt;
  auto it = obj.find("duration");
  if (it == obj.end())
    return std::nullopt;

  double value = 0;
  if (it->is_number()) {
    value = it->get<double>();
  } else if (it->is_string()) {
    const auto &s = it->get_ref<const std::string &>();
    try {
      size_t pos = 0;
      value = std::stod(s, &pos);
      if (pos == 0)
        return std::nullopt;
    } catch (const std::invalid_argument &) {
      return std::nullopt;
    } catch (const std::out_of_range &) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }

  return usable_duration(value);
}

ProbeReport probe_with_ffprobe(const std::string &path,
                               const ProbeOptions &options) {
  ProbeReport report;

  Subprocess proc;
  auto started = proc.start({options.ffprobe_path, "-v", "quiet",
                             "-print_format", "json", "-show_format",
                             "-show_streams", path});
  if (started == Subprocess::StartStatus::NotFound) {
    report.status = ProbeStatus::ToolNotFound;
    report.diagnostic = "ffprobe not found. Please install ffmpeg.";
    return report;
  }
  if (started != Subprocess::StartStatus::Started) {
    report.status = ProbeStatus::ProbeFailed;
    report.diagnostic =
        fmt::format("failed to start ffprobe: {}", proc.start_error());
    return report;
  }

  std::string out = proc.read_all();
  int rc = proc.wait();
  if (rc != 0) {
    report.status = ProbeStatus::ProbeFailed;
    report.diagnostic = proc.error_tail().empty()
                            ? fmt::format("ffprobe exit code {}", rc)
                            : proc.error_tail();
    return report;
  }

  if (!json::accept(out)) {
    report.status = ProbeStatus::ProbeFailed;
    report.diagnostic = "failed to parse ffprobe output";
    return report;
  }

  report.duration = parse_probe_output(out);
  report.status =
      report.duration ? ProbeStatus::Ok : ProbeStatus::NoDuration;
  if (!report.duration)
    report.diagnostic = "duration not found";
  return report;
}

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

ProbeReport probe_with_libav(const std::string &path) {
  ProbeReport report;

  AVFormatContext *fmt_ctx = nullptr;
  int err = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (err < 0) {
    report.status = ProbeStatus::ProbeFailed;
    report.diagnostic =
        fmt::format("avformat_open_input failed: {}", av_error_string(err));
    return report;
  }

  /// Reads some packets when the container header lacks stream info
  err = avformat_find_stream_info(fmt_ctx, nullptr);
  if (err < 0) {
    report.status = ProbeStatus::ProbeFailed;
    report.diagnostic = fmt::format("avformat_find_stream_info failed: {}",
                                    av_error_string(err));
    avformat_close_input(&fmt_ctx);
    return report;
  }

  std::optional<double> duration;
  if (fmt_ctx->duration != AV_NOPTS_VALUE)
    duration = usable_duration(static_cast<double>(fmt_ctx->duration) /
                               AV_TIME_BASE);
  if (!duration) {
    for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
      const AVStream *st = fmt_ctx->streams[i];
      if (st->duration == AV_NOPTS_VALUE)
        continue;
      if (auto d = usable_duration(st->duration * av_q2d(st->time_base)))
        duration = std::max(duration.value_or(0.0), *d);
    }
  }
  avformat_close_input(&fmt_ctx);

  report.duration = duration;
  report.status = duration ? ProbeStatus::Ok : ProbeStatus::NoDuration;
  if (!duration)
    report.diagnostic = "duration not found";
  return report;
}

} // anonymous namespace

std::optional<double> usable_duration(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0)
    return std::nullopt;
  return seconds;
}

ProbeBackend parse_probe_backend(const std::string &name) {
  return name == "libav" ? ProbeBackend::Libav : ProbeBackend::FFprobe;
}

std::optional<double> parse_probe_output(const std::string &json_text) {
  json info = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (info.is_discarded() || !info.is_object())
    return std::nullopt;

  auto fmt_it = info.find("format");
  if (fmt_it != info.end()) {
    if (auto d = read_duration_field(*fmt_it))
      return d;
  }

  /// Fallback: longest declared stream
  std::optional<double> longest;
  auto streams = info.find("streams");
  if (streams != info.end() && streams->is_array()) {
    for (const auto &st : *streams) {
      if (auto d = read_duration_field(st))
        longest = std::max(longest.value_or(0.0), *d);
    }
  }
  return longest;
}

ProbeReport probe_media(const std::string &path, const ProbeOptions &options) {
  if (options.backend == ProbeBackend::Libav)
    return probe_with_libav(path);
  return probe_with_ffprobe(path, options);
}

std::optional<double> probe_duration(const std::string &path,
                                     const ProbeOptions &options) {
  ProbeReport report = probe_media(path, options);
  if (report.status != ProbeStatus::Ok) {
    LOG_WARN("Duration unknown for {}: {}", path, report.diagnostic);
    return std::nullopt;
  }
  return report.duration;
}

} // namespace media_jobs
