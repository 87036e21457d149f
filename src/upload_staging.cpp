/**
 * @file upload_staging.cpp
 * @brief Temporary input file implementation
 *
 * @details Provides implementations for:
 *
 *          - StagedFile: RAII delete-on-destruction
 *
 *          - UploadStager::stage_bytes - write payload to a unique file
 *
 *          - UploadStager::stage_copy - copy a local file to a unique file
 */

#include "media_jobs/upload_staging.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "media_jobs/logging.hpp"

namespace media_jobs {

namespace fs = std::filesystem;

// **---- StagedFile Implementation ----**

StagedFile::~StagedFile() { remove(); }

StagedFile::StagedFile(StagedFile &&other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

StagedFile &StagedFile::operator=(StagedFile &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

std::string StagedFile::release() {
  std::string p = std::move(path_);
  path_.clear();
  return p;
}

bool StagedFile::remove() {
  if (path_.empty())
    return false;

  std::error_code ec;
  bool removed = fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove staged input {}: {}", path_, ec.message());
  }
  path_.clear();
  return removed;
}

// **---- UploadStager Implementation ----**

UploadStager::UploadStager(std::string staging_dir)
    : dir_(std::move(staging_dir)) {}

std::string UploadStager::suffix_hint(const std::string &filename) {
  std::string name = fs::path(filename).filename().string();
  size_t dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
    return "";

  std::string ext = name.substr(dot);
  if (ext.size() > 17)
    return "";
  for (size_t i = 1; i < ext.size(); ++i) {
    if (!std::isalnum(static_cast<unsigned char>(ext[i])))
      return "";
  }
  return ext;
}

int UploadStager::create_unique(const std::string &suffix, std::string &path,
                                std::string &error) const {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    error = fmt::format("cannot create staging directory {}: {}", dir_,
                        ec.message());
    return -1;
  }

  std::string pattern = (fs::path(dir_) / "upload_XXXXXX").string() + suffix;
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    error = fmt::format("cannot create staged file: {}", std::strerror(errno));
    return -1;
  }
  path.assign(buf.data());
  return fd;
}

StagedFile UploadStager::stage_bytes(const std::string &payload,
                                     const std::string &original_filename,
                                     std::string &error) const {
  if (payload.empty()) {
    error = "file field missing";
    return StagedFile();
  }

  std::string path;
  int fd = create_unique(suffix_hint(original_filename), path, error);
  if (fd == -1)
    return StagedFile();

  /// Owns the path from here on, so every failure below cleans up
  StagedFile staged(path);

  const char *data = payload.data();
  size_t left = payload.size();
  while (left > 0) {
    ssize_t w = ::write(fd, data, left);
    if (w == -1) {
      if (errno == EINTR)
        continue;
      error = fmt::format("failed to write staged file: {}",
                          std::strerror(errno));
      ::close(fd);
      return StagedFile();
    }
    data += w;
    left -= static_cast<size_t>(w);
  }

  if (::close(fd) == -1) {
    error = fmt::format("failed to close staged file: {}",
                        std::strerror(errno));
    return StagedFile();
  }
  return staged;
}

StagedFile UploadStager::stage_copy(const std::string &source_path,
                                    const std::string &original_filename,
                                    std::string &error) const {
  struct stat sb;
  if (stat(source_path.c_str(), &sb) == -1 || !S_ISREG(sb.st_mode)) {
    error = fmt::format("cannot read {}", source_path);
    return StagedFile();
  }
  if (sb.st_size <= 0) {
    error = fmt::format("file is empty: {}", source_path);
    return StagedFile();
  }

  std::string path;
  int fd = create_unique(suffix_hint(original_filename), path, error);
  if (fd == -1)
    return StagedFile();
  ::close(fd);

  StagedFile staged(path);

  std::error_code ec;
  fs::copy_file(source_path, path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = fmt::format("failed to copy {}: {}", source_path, ec.message());
    return StagedFile();
  }
  return staged;
}

} // namespace media_jobs
