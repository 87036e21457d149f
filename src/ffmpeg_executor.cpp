/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "media_jobs/ffmpeg_executor.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "media_jobs/logging.hpp"
#include "media_jobs/subprocess.hpp"

namespace media_jobs {

std::vector<std::string> build_ffmpeg_command(const std::string &input_path,
                                              const std::string &output_path,
                                              const EncoderOptions &options) {
  const EncodeProfile &p = options.profile;

  std::vector<std::string> cmd = {options.ffmpeg_path, "-y", "-hide_banner",
                                  "-loglevel", "error", "-i", input_path};
  if (p.faststart) {
    cmd.push_back("-movflags");
    cmd.push_back("+faststart");
  }
  cmd.insert(cmd.end(), {"-c:v", p.video_codec, "-profile:v", p.video_profile,
                         "-pix_fmt", p.pixel_format, "-preset", p.preset,
                         "-crf", std::to_string(p.crf)});
  cmd.insert(cmd.end(),
             {"-c:a", p.audio_codec, "-b:a", p.audio_bitrate});

  /// Machine-readable progress on stdout, no interactive stats on stderr
  cmd.insert(cmd.end(), {"-progress", "pipe:1", "-nostats", output_path});
  return cmd;
}

EncodeResult execute_ffmpeg_transcode(const std::string &input_path,
                                      const std::string &output_path,
                                      const EncoderOptions &options,
                                      const ProgressLineHandler &on_line,
                                      const std::string &job_id) {
  EncodeResult result;
  std::string prefix = job_id.empty() ? "" : fmt::format("[Job {}] ", job_id);

  Subprocess proc(options.diagnostic_tail_bytes);
  auto started =
      proc.start(build_ffmpeg_command(input_path, output_path, options));

  if (started == Subprocess::StartStatus::NotFound) {
    LOG_ERROR("{}ffmpeg not found at '{}': {}", prefix, options.ffmpeg_path,
              proc.start_error());
    result.status = EncodeStatus::ToolNotFound;
    result.diagnostic = "ffmpeg not found. Please install ffmpeg.";
    return result;
  }
  if (started != Subprocess::StartStatus::Started) {
    LOG_ERROR("{}Failed to start ffmpeg: {}", prefix, proc.start_error());
    result.status = EncodeStatus::EncodeFailed;
    result.diagnostic =
        fmt::format("failed to start ffmpeg: {}", proc.start_error());
    return result;
  }

  LOG_INFO("{}Encoding {} -> {}", prefix,
           std::filesystem::path(input_path).filename().string(),
           std::filesystem::path(output_path).filename().string());

  proc.set_timeout(options.timeout_sec);

  std::string line;
  while (proc.next_line(line)) {
    if (on_line && !on_line(line))
      break;
  }

  result.exit_code = proc.wait();

  if (proc.timed_out()) {
    LOG_ERROR("{}ffmpeg timed out after {:.0f}s", prefix, options.timeout_sec);
    result.status = EncodeStatus::TimedOut;
    result.diagnostic =
        fmt::format("encode timed out after {:.0f} s", options.timeout_sec);
    return result;
  }

  if (result.exit_code != 0) {
    LOG_ERROR("{}ffmpeg failed with status {}", prefix, result.exit_code);
    result.status = EncodeStatus::EncodeFailed;
    result.diagnostic =
        proc.error_tail().empty()
            ? fmt::format("ffmpeg exit code {}", result.exit_code)
            : proc.error_tail();
    return result;
  }

  result.status = EncodeStatus::Success;
  return result;
}

} // namespace media_jobs
