/**
 * @file upload_staging.hpp
 * @brief Temporary input files for submitted payloads
 *
 * @details Provides:
 *          - StagedFile: RAII owner that deletes a staged input exactly once
 *
 *          - UploadStager: writes payloads (or copies of local files) to
 *            uniquely named files that keep the original suffix
 *
 */

#ifndef MEDIA_JOBS_UPLOAD_STAGING_HPP
#define MEDIA_JOBS_UPLOAD_STAGING_HPP

#include <string>

namespace media_jobs {

/**
 * @class StagedFile
 * @brief RAII wrapper for a temporary input file.
 * @note The file is removed on destruction unless ownership was released.
 *       Supports move semantics but not copy.
 */
class StagedFile {
public:
  StagedFile() = default;
  explicit StagedFile(std::string path) : path_(std::move(path)) {}
  ~StagedFile();

  /// Disable copy
  StagedFile(const StagedFile &) = delete;
  StagedFile &operator=(const StagedFile &) = delete;

  /// Enable move
  StagedFile(StagedFile &&other) noexcept;
  StagedFile &operator=(StagedFile &&other) noexcept;

  const std::string &path() const { return path_; }
  bool is_valid() const { return !path_.empty(); }

  /**
   * @brief Give up ownership without deleting.
   * @return The path; this object becomes empty
   */
  std::string release();

  /**
   * @brief Delete the file now.
   * @return true if a file was removed
   */
  bool remove();

private:
  std::string path_;
};

/**
 * @class UploadStager
 * @brief Persists submitted media into the staging directory.
 *
 * @attention NAMING:
 *
 * - mkstemps() picks the name, so concurrent submissions never collide
 *
 * - The original filename only contributes its suffix (".mkv"), which
 *   helps ffmpeg pick a demuxer; unsafe suffixes are dropped
 */
class UploadStager {
public:
  explicit UploadStager(std::string staging_dir);

  /**
   * @brief Write an in-memory payload to a new staged file.
   * @param payload Raw file content (must not be empty)
   * @param original_filename Client-side name, for the suffix hint
   * @param error Output: reason on failure
   * @return Owning handle; invalid on failure
   */
  StagedFile stage_bytes(const std::string &payload,
                         const std::string &original_filename,
                         std::string &error) const;

  /**
   * @brief Copy an existing local file into a new staged file.
   * @note The source is never modified or removed.
   */
  StagedFile stage_copy(const std::string &source_path,
                        const std::string &original_filename,
                        std::string &error) const;

  /**
   * @brief Suffix of a filename if it is safe to reuse.
   * @return ".ext" (at most 16 alphanumerics) or an empty string
   */
  static std::string suffix_hint(const std::string &filename);

  const std::string &directory() const { return dir_; }

private:
  /// Create an empty unique file; returns its fd or -1
  int create_unique(const std::string &suffix, std::string &path,
                    std::string &error) const;

  std::string dir_;
};

} // namespace media_jobs

#endif // MEDIA_JOBS_UPLOAD_STAGING_HPP
