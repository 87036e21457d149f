/**
 * @file progress_parser.cpp
 * @brief ffmpeg progress line parsing implementation
 */

#include "media_jobs/progress_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace media_jobs {

namespace {

std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() &&
         std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

} // anonymous namespace

ProgressParser::ProgressParser(std::optional<double> duration_seconds) {
  if (duration_seconds && std::isfinite(*duration_seconds) &&
      *duration_seconds > 0)
    duration_ = duration_seconds;
}

std::optional<double>
ProgressParser::parse_elapsed_seconds(const std::string &line) {
  std::string l = trim(line);
  size_t eq = l.find('=');
  if (eq == std::string::npos)
    return std::nullopt;

  std::string key = trim(l.substr(0, eq));
  if (key != "out_time_ms")
    return std::nullopt;

  std::string value = trim(l.substr(eq + 1));
  if (value.empty())
    return std::nullopt;

  try {
    size_t pos = 0;
    long long us = std::stoll(value, &pos);
    if (pos != value.size())
      return std::nullopt;
    return static_cast<double>(us) / 1000000.0;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<double> ProgressParser::feed(const std::string &line) {
  if (finished_)
    return std::nullopt;

  std::string l = trim(line);
  if (l.rfind("progress=", 0) == 0) {
    if (l.compare(9, std::string::npos, "end") == 0)
      finished_ = true;
    return std::nullopt;
  }

  auto elapsed = parse_elapsed_seconds(l);
  if (!elapsed)
    return std::nullopt;

  elapsed_sec_ = *elapsed;
  if (duration_) {
    double f = std::clamp(*elapsed / *duration_, 0.0, 1.0);
    fraction_ = std::max(fraction_, f);
  } else {
    fraction_ =
        std::min(PENDING_PROGRESS_CAP, fraction_ + UNKNOWN_DURATION_STEP);
  }
  return fraction_;
}

} // namespace media_jobs
