/**
 * @file ffmpeg_executor.hpp
 * @brief FFmpeg execution for browser-playable transcodes
 *
 * @details Runs one ffmpeg process with a fixed H.264/AAC MP4 profile and
 *          hands each line of its `-progress pipe:1` stream to the caller
 *          while it runs.
 */

#ifndef MEDIA_JOBS_FFMPEG_EXECUTOR_HPP
#define MEDIA_JOBS_FFMPEG_EXECUTOR_HPP

#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace media_jobs {

/**
 * @struct EncodeProfile
 * @brief Target codec/container settings.
 * @note Defaults produce a file every mainstream browser can play while it
 *       is still downloading (moov atom first).
 */
struct EncodeProfile {
  std::string video_codec = "libx264";
  std::string video_profile = "main";
  std::string pixel_format = "yuv420p";
  std::string preset = "veryfast";
  int crf = 23;
  std::string audio_codec = "aac";
  std::string audio_bitrate = "128k";
  bool faststart = true;
};

/**
 * @struct EncoderOptions
 * @brief Binary location, profile and limits for one encode.
 */
struct EncoderOptions {
  std::string ffmpeg_path = Config::ffmpeg_path();
  EncodeProfile profile;
  double timeout_sec = Config::encode_timeout_sec(); //< 0 = none
  size_t diagnostic_tail_bytes = DIAGNOSTIC_TAIL_BYTES;
};

enum class EncodeStatus {
  Success,      //< Exit code 0, output complete
  ToolNotFound, //< ffmpeg could not be executed
  EncodeFailed, //< Non-zero exit
  TimedOut      //< Killed after EncoderOptions::timeout_sec
};

/**
 * @struct EncodeResult
 * @brief Outcome of execute_ffmpeg_transcode().
 */
struct EncodeResult {
  EncodeStatus status = EncodeStatus::EncodeFailed;
  int exit_code = -1;
  std::string diagnostic; //< stderr tail, or a fixed message
};

/**
 * @brief Receives each progress line; return false to stop reading.
 * @note ffmpeg keeps running after a false return; its exit code is still
 *       awaited.
 */
using ProgressLineHandler = std::function<bool(const std::string &)>;

/**
 * @brief Build the ffmpeg argv for a transcode.
 */
std::vector<std::string> build_ffmpeg_command(const std::string &input_path,
                                              const std::string &output_path,
                                              const EncoderOptions &options);

/**
 * @brief Execute ffmpeg to transcode a file.
 *
 * @param input_path Path to the input media (left in place)
 * @param output_path Path of the MP4 to produce (overwritten)
 * @param options Binary, profile and timeout
 * @param on_line Called for each progress line, in emission order
 * @param job_id Job ID for logging (empty = no prefix)
 * @return Outcome with exit code and diagnostic tail
 */
EncodeResult execute_ffmpeg_transcode(const std::string &input_path,
                                      const std::string &output_path,
                                      const EncoderOptions &options,
                                      const ProgressLineHandler &on_line,
                                      const std::string &job_id = {});

/// Signature of execute_ffmpeg_transcode(), for swapping the encoder
using EncodeFunction = std::function<EncodeResult(
    const std::string &input_path, const std::string &output_path,
    const EncoderOptions &options, const ProgressLineHandler &on_line,
    const std::string &job_id)>;

} // namespace media_jobs

#endif // MEDIA_JOBS_FFMPEG_EXECUTOR_HPP
