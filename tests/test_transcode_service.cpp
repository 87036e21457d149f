/**
 * @file test_transcode_service.cpp
 * @brief Submission, status polling, overload and retention
 */

#include <filesystem>
#include <memory>
#include <regex>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "media_jobs/transcode_service.hpp"
#include "test_helpers.hpp"

using namespace media_jobs;
using media_jobs::test::TempDir;
using media_jobs::test::count_files;
using media_jobs::test::fake_ffmpeg;
using media_jobs::test::wait_until;

namespace fs = std::filesystem;

class TranscodeServiceTest : public ::testing::Test {
protected:
  ServiceOptions base_options(const std::string &ffmpeg) {
    ServiceOptions o;
    o.output_dir = dir_.file("out");
    o.staging_dir = dir_.file("staging");
    o.url_prefix = "/transcoded";
    o.max_concurrent_jobs = 2;
    o.queue_capacity = 8;
    o.retention_sec = 3600;
    o.sweep_interval_sec = 0;
    o.runner.probe.ffprobe_path = dir_.file("no-ffprobe");
    o.runner.probe.backend = ProbeBackend::FFprobe;
    o.runner.encoder.ffmpeg_path = ffmpeg;
    o.runner.encoder.timeout_sec = 0;
    return o;
  }

  std::string ok_ffmpeg() {
    return fake_ffmpeg(dir_, "ffmpeg",
                       "out_time_ms=4000000\\nprogress=continue\\n"
                       "progress=end\\n",
                       0);
  }

  bool finished(const TranscodeService &svc, const std::string &id) {
    return wait_until([&] {
      auto s = svc.status(id);
      return s && is_terminal(s->status);
    });
  }

  TempDir dir_;
};

TEST_F(TranscodeServiceTest, SubmitRunsJobToCompletion) {
  TranscodeService svc(base_options(ok_ffmpeg()));

  SubmitResult r = svc.submit("not really matroska", "holiday.mkv", 8.0);
  ASSERT_EQ(r.status, SubmitStatus::Accepted);
  EXPECT_TRUE(std::regex_match(r.job_id, std::regex("[0-9a-f]{32}")));

  ASSERT_TRUE(finished(svc, r.job_id));
  auto s = svc.status(r.job_id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->status, JobStatus::Done);
  EXPECT_DOUBLE_EQ(s->progress, 1.0);
  ASSERT_TRUE(s->result_url.has_value());
  EXPECT_EQ(s->result_url->rfind("/transcoded/", 0), 0u);
  EXPECT_EQ(fs::path(*s->result_url).extension(), ".mp4");

  fs::path produced =
      fs::path(svc.options().output_dir) / fs::path(*s->result_url).filename();
  EXPECT_TRUE(fs::exists(produced));
  EXPECT_EQ(count_files(svc.options().staging_dir), 0u);
}

TEST_F(TranscodeServiceTest, StatusJsonShape) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  SubmitResult r = svc.submit("bytes", "clip.mov", 8.0);
  ASSERT_TRUE(finished(svc, r.job_id));

  auto text = svc.status_json(r.job_id);
  ASSERT_TRUE(text.has_value());
  auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j["status"], "done");
  EXPECT_DOUBLE_EQ(j["progress"].get<double>(), 1.0);
  EXPECT_TRUE(j.contains("message"));
  EXPECT_TRUE(j.contains("url"));
  EXPECT_DOUBLE_EQ(j["duration"].get<double>(), 8.0);
}

TEST(JobToJson, OmitsUnsetFields) {
  JobState s;
  s.id = "abc";
  s.progress = 0.25;
  auto j = job_to_json(s);
  EXPECT_EQ(j["status"], "running");
  EXPECT_DOUBLE_EQ(j["progress"].get<double>(), 0.25);
  EXPECT_EQ(j["message"], "");
  EXPECT_FALSE(j.contains("url"));
  EXPECT_FALSE(j.contains("duration"));
  EXPECT_FALSE(j.contains("id"));
}

TEST_F(TranscodeServiceTest, EmptyPayloadIsBadRequest) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  SubmitResult r = svc.submit("", "clip.mkv");
  EXPECT_EQ(r.status, SubmitStatus::BadRequest);
  EXPECT_EQ(r.message, "file field missing");
  EXPECT_TRUE(r.job_id.empty());
  EXPECT_EQ(svc.job_count(), 0u);
}

TEST_F(TranscodeServiceTest, MissingSourceIsBadRequest) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  SubmitResult r = svc.submit_file(dir_.file("absent.mkv"), "absent.mkv");
  EXPECT_EQ(r.status, SubmitStatus::BadRequest);
  EXPECT_EQ(svc.job_count(), 0u);
}

TEST_F(TranscodeServiceTest, SubmitFileKeepsSource) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  std::string source = dir_.file("source.mkv");
  media_jobs::test::write_file(source, "source bytes");

  SubmitResult r = svc.submit_file(source, "source.mkv", 8.0);
  ASSERT_EQ(r.status, SubmitStatus::Accepted);
  ASSERT_TRUE(finished(svc, r.job_id));
  EXPECT_EQ(svc.status(r.job_id)->status, JobStatus::Done);
  EXPECT_EQ(media_jobs::test::read_file(source), "source bytes");
}

TEST_F(TranscodeServiceTest, UnknownIdIsNotFound) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  EXPECT_FALSE(svc.status("nonexistent").has_value());
  EXPECT_FALSE(svc.status_json("nonexistent").has_value());
  EXPECT_EQ(svc.job_count(), 0u);
}

TEST_F(TranscodeServiceTest, FailedJobReportsDiagnostic) {
  ServiceOptions opts = base_options(fake_ffmpeg(
      dir_, "ffmpeg", "progress=continue\\n", 1, "unsupported codec\\n"));
  TranscodeService svc(opts);

  SubmitResult r = svc.submit("bytes", "clip.avi");
  ASSERT_EQ(r.status, SubmitStatus::Accepted);
  ASSERT_TRUE(finished(svc, r.job_id));

  auto s = svc.status(r.job_id);
  EXPECT_EQ(s->status, JobStatus::Error);
  EXPECT_NE(s->message.find("unsupported codec"), std::string::npos);
  EXPECT_FALSE(s->result_url.has_value());
  EXPECT_LT(s->progress, 1.0);
  EXPECT_EQ(count_files(opts.staging_dir), 0u);

  auto j = nlohmann::json::parse(*svc.status_json(r.job_id));
  EXPECT_EQ(j["status"], "error");
  EXPECT_FALSE(j.contains("url"));
}

TEST_F(TranscodeServiceTest, RepeatedPollsAreIdentical) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  SubmitResult r = svc.submit("bytes", "clip.mkv", 8.0);
  ASSERT_TRUE(finished(svc, r.job_id));

  auto first = svc.status_json(r.job_id);
  auto second = svc.status_json(r.job_id);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first, second);
}

TEST_F(TranscodeServiceTest, FullQueueIsOverloaded) {
  std::string gate = dir_.file("gate");
  ServiceOptions opts = base_options(media_jobs::test::gated_ffmpeg(
      dir_, "ffmpeg", "progress=continue\\n", gate));
  opts.max_concurrent_jobs = 1;
  opts.queue_capacity = 1;
  TranscodeService svc(opts);
  ASSERT_EQ(svc.workers(), 1);

  SubmitResult a = svc.submit("a", "a.mkv");
  ASSERT_EQ(a.status, SubmitStatus::Accepted);
  ASSERT_TRUE(wait_until([&] { return svc.queued() == 0; }));
  ASSERT_TRUE(wait_until([&] { return svc.running() == 1; }));

  SubmitResult b = svc.submit("b", "b.mkv");
  EXPECT_EQ(b.status, SubmitStatus::Accepted);

  SubmitResult c = svc.submit("c", "c.mkv");
  EXPECT_EQ(c.status, SubmitStatus::Overloaded);
  EXPECT_TRUE(c.job_id.empty());
  EXPECT_EQ(c.message, "server overloaded, try again later");
  EXPECT_EQ(svc.job_count(), 2u);
  EXPECT_EQ(count_files(opts.staging_dir), 2u);

  media_jobs::test::write_file(gate, "");
  ASSERT_TRUE(finished(svc, a.job_id));
  ASSERT_TRUE(finished(svc, b.job_id));
  EXPECT_EQ(svc.status(b.job_id)->status, JobStatus::Done);
  EXPECT_TRUE(wait_until([&] { return svc.running() == 0; }));
}

TEST_F(TranscodeServiceTest, SweepEvictsFinishedJobs) {
  std::string gate = dir_.file("gate");
  ServiceOptions opts = base_options(media_jobs::test::gated_ffmpeg(
      dir_, "ffmpeg", "progress=continue\\n", gate));
  opts.retention_sec = 0;
  TranscodeService svc(opts);

  SubmitResult running = svc.submit("x", "x.mkv");
  ASSERT_TRUE(wait_until([&] { return svc.status(running.job_id)->progress > 0; }));
  EXPECT_EQ(svc.sweep_expired(), 0u);
  EXPECT_TRUE(svc.status(running.job_id).has_value());

  media_jobs::test::write_file(gate, "");
  ASSERT_TRUE(finished(svc, running.job_id));
  EXPECT_EQ(svc.sweep_expired(), 1u);
  EXPECT_FALSE(svc.status(running.job_id).has_value());
  EXPECT_EQ(svc.job_count(), 0u);
}

TEST_F(TranscodeServiceTest, BackgroundSweeperEvicts) {
  ServiceOptions opts = base_options(ok_ffmpeg());
  opts.retention_sec = 0;
  opts.sweep_interval_sec = 0.05;
  TranscodeService svc(opts);

  SubmitResult r = svc.submit("bytes", "clip.mkv", 8.0);
  ASSERT_EQ(r.status, SubmitStatus::Accepted);
  EXPECT_TRUE(wait_until([&] { return svc.job_count() == 0; }));
  EXPECT_FALSE(svc.status(r.job_id).has_value());
}

TEST_F(TranscodeServiceTest, ShutdownIsIdempotent) {
  TranscodeService svc(base_options(ok_ffmpeg()));
  SubmitResult r = svc.submit("bytes", "clip.mkv", 8.0);
  svc.shutdown();
  svc.shutdown();
  auto s = svc.status(r.job_id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->status, JobStatus::Done);
}
