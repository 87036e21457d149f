/**
 * @file subprocess.cpp
 * @brief External tool execution implementation
 */

#include "media_jobs/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "media_jobs/logging.hpp"

extern char **environ;

namespace media_jobs {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;

/// Longest single poll() so the deadline is re-checked regularly
constexpr int MAX_POLL_MS = 250;

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // anonymous namespace

Subprocess::Subprocess(size_t tail_limit) : tail_limit_(tail_limit) {}

Subprocess::~Subprocess() {
  if (running()) {
    kill();
    int status = 0;
    while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
  }
  close_pipes();
}

Subprocess::StartStatus
Subprocess::start(const std::vector<std::string> &argv) {
  if (argv.empty() || pid_ > 0) {
    start_error_ = "invalid start";
    return StartStatus::Failed;
  }

  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    start_error_ = std::strerror(errno);
    return StartStatus::Failed;
  }
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    start_error_ = std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return StartStatus::Failed;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(),
                        environ);
  posix_spawn_file_actions_destroy(&actions);

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  if (rc != 0) {
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    start_error_ = std::strerror(rc);
    return (rc == ENOENT || rc == EACCES || rc == ENOTDIR ||
            rc == ENOEXEC)
               ? StartStatus::NotFound
               : StartStatus::Failed;
  }

  pid_ = pid;
  out_fd_ = out_pipe[0];
  err_fd_ = err_pipe[0];
  return StartStatus::Started;
}

void Subprocess::set_timeout(double seconds) {
  if (seconds <= 0) {
    deadline_.reset();
    return;
  }
  deadline_ = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                 std::chrono::duration<double>(seconds));
}

bool Subprocess::pump() {
  if (timed_out_)
    return false;

  while (out_fd_ >= 0 || err_fd_ >= 0) {
    int timeout_ms = -1;
    if (deadline_) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      *deadline_ - Clock::now())
                      .count();
      if (left <= 0) {
        timed_out_ = true;
        return false;
      }
      timeout_ms = static_cast<int>(std::min<long long>(left, MAX_POLL_MS));
    }

    pollfd fds[2];
    nfds_t n = 0;
    int out_idx = -1;
    int err_idx = -1;
    if (out_fd_ >= 0) {
      out_idx = static_cast<int>(n);
      fds[n++] = {out_fd_, POLLIN, 0};
    }
    if (err_fd_ >= 0) {
      err_idx = static_cast<int>(n);
      fds[n++] = {err_fd_, POLLIN, 0};
    }

    int ready = ::poll(fds, n, timeout_ms);
    if (ready == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("poll() on child {} failed: {}", pid_, std::strerror(errno));
      close_pipes();
      return false;
    }
    if (ready == 0)
      continue;

    char buf[READ_CHUNK];
    bool got_stdout = false;

    if (err_idx >= 0 && fds[err_idx].revents != 0) {
      ssize_t r = ::read(err_fd_, buf, sizeof(buf));
      if (r > 0)
        append_tail(buf, static_cast<size_t>(r));
      else if (r == 0 || (errno != EINTR && errno != EAGAIN))
        close_fd(err_fd_);
    }

    if (out_idx >= 0 && fds[out_idx].revents != 0) {
      ssize_t r = ::read(out_fd_, buf, sizeof(buf));
      if (r > 0) {
        out_buf_.append(buf, static_cast<size_t>(r));
        got_stdout = true;
      } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
        close_fd(out_fd_);
        got_stdout = true;
      }
    }

    if (got_stdout)
      return true;
  }
  return false;
}

bool Subprocess::next_line(std::string &line) {
  while (true) {
    size_t nl = out_buf_.find('\n');
    if (nl != std::string::npos) {
      line.assign(out_buf_, 0, nl);
      out_buf_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return true;
    }

    if (out_fd_ < 0 || timed_out_) {
      /// Final unterminated line
      if (!out_buf_.empty() && !timed_out_) {
        line = std::move(out_buf_);
        out_buf_.clear();
        return true;
      }
      return false;
    }

    if (!pump() && out_fd_ >= 0)
      return false;
  }
}

std::string Subprocess::read_all() {
  while (out_fd_ >= 0) {
    if (!pump() && out_fd_ >= 0)
      break;
  }
  std::string out = std::move(out_buf_);
  out_buf_.clear();
  return out;
}

int Subprocess::wait() {
  if (pid_ <= 0)
    return -1;
  if (reaped_)
    return exit_code_;

  /// Keep draining so the child never blocks on a full pipe
  while (!timed_out_ && (out_fd_ >= 0 || err_fd_ >= 0)) {
    if (!pump())
      break;
    out_buf_.clear();
  }

  if (timed_out_)
    kill();
  close_pipes();

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r == -1 && errno == EINTR);
  reaped_ = true;

  if (r == -1) {
    LOG_ERROR("waitpid({}) failed: {}", pid_, std::strerror(errno));
    exit_code_ = -1;
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
  return exit_code_;
}

void Subprocess::kill() {
  if (running())
    ::kill(pid_, SIGKILL);
}

void Subprocess::append_tail(const char *data, size_t n) {
  err_tail_.append(data, n);
  if (err_tail_.size() > tail_limit_)
    err_tail_.erase(0, err_tail_.size() - tail_limit_);
}

void Subprocess::close_pipes() {
  close_fd(out_fd_);
  close_fd(err_fd_);
}

} // namespace media_jobs
