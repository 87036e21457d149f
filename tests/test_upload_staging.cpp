/**
 * @file test_upload_staging.cpp
 * @brief Staged input files and their cleanup
 */

#include <filesystem>
#include <utility>

#include <gtest/gtest.h>

#include "media_jobs/upload_staging.hpp"
#include "test_helpers.hpp"

using namespace media_jobs;
using media_jobs::test::TempDir;
using media_jobs::test::read_file;
using media_jobs::test::write_file;

namespace fs = std::filesystem;

TEST(SuffixHint, KeepsSimpleExtensions) {
  EXPECT_EQ(UploadStager::suffix_hint("movie.mkv"), ".mkv");
  EXPECT_EQ(UploadStager::suffix_hint("archive.tar.webm"), ".webm");
  EXPECT_EQ(UploadStager::suffix_hint("/home/user/Clip.MOV"), ".MOV");
  EXPECT_EQ(UploadStager::suffix_hint("capture.ts"), ".ts");
}

TEST(SuffixHint, DropsUnsafeOrMissingExtensions) {
  EXPECT_EQ(UploadStager::suffix_hint(""), "");
  EXPECT_EQ(UploadStager::suffix_hint("noext"), "");
  EXPECT_EQ(UploadStager::suffix_hint(".hidden"), "");
  EXPECT_EQ(UploadStager::suffix_hint("trailing."), "");
  EXPECT_EQ(UploadStager::suffix_hint("evil.m k v"), "");
  EXPECT_EQ(UploadStager::suffix_hint("evil.mkv;rm"), "");
  EXPECT_EQ(UploadStager::suffix_hint("long.abcdefghijklmnopq"), "");
  EXPECT_EQ(UploadStager::suffix_hint("ok.abcdefghijklmnop"),
            ".abcdefghijklmnop");
}

class UploadStagingTest : public ::testing::Test {
protected:
  std::string staging() { return dir_.file("staging"); }

  TempDir dir_;
};

TEST_F(UploadStagingTest, StageBytesWritesUniqueFiles) {
  UploadStager stager(staging());
  std::string error;

  StagedFile a = stager.stage_bytes("first payload", "a.mkv", error);
  StagedFile b = stager.stage_bytes("second payload", "a.mkv", error);
  ASSERT_TRUE(a.is_valid());
  ASSERT_TRUE(b.is_valid());

  EXPECT_NE(a.path(), b.path());
  EXPECT_EQ(fs::path(a.path()).parent_path(), fs::path(staging()));
  EXPECT_EQ(fs::path(a.path()).extension(), ".mkv");
  EXPECT_EQ(read_file(a.path()), "first payload");
  EXPECT_EQ(read_file(b.path()), "second payload");
}

TEST_F(UploadStagingTest, EmptyPayloadRejected) {
  UploadStager stager(staging());
  std::string error;
  StagedFile f = stager.stage_bytes("", "a.mkv", error);
  EXPECT_FALSE(f.is_valid());
  EXPECT_EQ(error, "file field missing");
  EXPECT_EQ(media_jobs::test::count_files(staging()), 0u);
}

TEST_F(UploadStagingTest, StagedFileRemovedOnDestruction) {
  UploadStager stager(staging());
  std::string error;
  std::string path;
  {
    StagedFile f = stager.stage_bytes("data", "clip.mp4", error);
    path = f.path();
    EXPECT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(UploadStagingTest, ReleaseKeepsFile) {
  UploadStager stager(staging());
  std::string error;
  std::string path;
  {
    StagedFile f = stager.stage_bytes("data", "clip.mp4", error);
    path = f.release();
    EXPECT_FALSE(f.is_valid());
  }
  EXPECT_TRUE(fs::exists(path));

  StagedFile adopted(path);
  EXPECT_TRUE(adopted.remove());
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(adopted.remove());
}

TEST_F(UploadStagingTest, MoveTransfersOwnership) {
  UploadStager stager(staging());
  std::string error;
  StagedFile a = stager.stage_bytes("data", "clip.mkv", error);
  std::string path = a.path();

  StagedFile b(std::move(a));
  EXPECT_FALSE(a.is_valid());
  EXPECT_EQ(b.path(), path);

  StagedFile c = stager.stage_bytes("other", "clip.mkv", error);
  std::string replaced = c.path();
  c = std::move(b);
  EXPECT_FALSE(fs::exists(replaced));
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(UploadStagingTest, StageCopyKeepsSource) {
  UploadStager stager(staging());
  std::string source = dir_.file("source.mov");
  write_file(source, "quicktime");

  std::string error;
  StagedFile f = stager.stage_copy(source, "source.mov", error);
  ASSERT_TRUE(f.is_valid()) << error;
  EXPECT_NE(f.path(), source);
  EXPECT_EQ(read_file(f.path()), "quicktime");

  f.remove();
  EXPECT_EQ(read_file(source), "quicktime");
}

TEST_F(UploadStagingTest, StageCopyRejectsMissingOrEmptySource) {
  UploadStager stager(staging());
  std::string error;

  StagedFile missing = stager.stage_copy(dir_.file("nope.mkv"), "nope.mkv", error);
  EXPECT_FALSE(missing.is_valid());
  EXPECT_NE(error.find("cannot read"), std::string::npos);

  std::string empty = dir_.file("empty.mkv");
  write_file(empty, "");
  StagedFile e = stager.stage_copy(empty, "empty.mkv", error);
  EXPECT_FALSE(e.is_valid());
  EXPECT_NE(error.find("file is empty"), std::string::npos);

  StagedFile dir = stager.stage_copy(dir_.path().string(), "dir", error);
  EXPECT_FALSE(dir.is_valid());
}
