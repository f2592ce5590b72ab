//
// Filter installation unit tests for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include <config.h>
#include "filterinst/install.h"
#include "filterinst/test-helpers.h"

#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>
#include <string>

using filterinst_test::FileMode;
using filterinst_test::LogCapture;
using filterinst_test::TempDir;

namespace {

class InstallTest : public testing::Test {
 protected:
  void SetUp() override {
    old_umask_ = umask(022);
    ASSERT_FALSE(source_.path().empty());
    ASSERT_FALSE(target_.path().empty());

    memset(&params_, 0, sizeof(params_));
    snprintf(params_.filter_name, sizeof(params_.filter_name), "%s",
             "cprastertocmd");
    snprintf(params_.source_dir, sizeof(params_.source_dir), "%s",
             source_.path().c_str());
    snprintf(params_.filter_dir, sizeof(params_.filter_dir), "%s",
             target_.path().c_str());
    params_.sync = 0;
  }

  void TearDown() override { umask(old_umask_); }

  // Bytes that look like a small binary, including NULs.
  static std::string FilterContents() {
    std::string contents("\177ELF\002\001\001\000", 8);
    for (int i = 0; i < 100000; i ++)
      contents += static_cast<char>(i % 251);
    return contents;
  }

  mode_t old_umask_;
  TempDir source_;
  TempDir target_;
  fi_install_t params_;
  LogCapture logs_;
};

TEST_F(InstallTest, CopiesAndMarksExecutable) {
  const std::string contents = FilterContents();
  source_.WriteFile("cprastertocmd", contents, 0644);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));

  std::string installed = target_.Join("cprastertocmd");
  EXPECT_EQ(contents, TempDir::ReadFile(installed));
  EXPECT_EQ(0755, FileMode(installed));
  EXPECT_EQ(0u, logs_.Count(FI_LOGLEVEL_ERROR));
}

TEST_F(InstallTest, ReportsWhatItInstalls) {
  source_.WriteFile("cprastertocmd", "filter", 0755);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_INFO,
                             "installing cprastertocmd to directory " +
                                 target_.path()));
}

TEST_F(InstallTest, ReadOnlySourceBecomesExecutableForAll) {
  source_.WriteFile("cprastertocmd", "filter", 0400);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_EQ(0511, FileMode(target_.Join("cprastertocmd")));
}

TEST_F(InstallTest, OverwritesExistingFilterKeepingItsMode) {
  source_.WriteFile("cprastertocmd", "new filter", 0644);
  target_.WriteFile("cprastertocmd", "old filter that is longer", 0600);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));

  std::string installed = target_.Join("cprastertocmd");
  EXPECT_EQ("new filter", TempDir::ReadFile(installed));
  EXPECT_EQ(0711, FileMode(installed));
}

TEST_F(InstallTest, EmptyFilter) {
  source_.WriteFile("cprastertocmd", "", 0644);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_EQ("", TempDir::ReadFile(target_.Join("cprastertocmd")));
  EXPECT_EQ(0755, FileMode(target_.Join("cprastertocmd")));
}

TEST_F(InstallTest, MissingSourceFails) {
  EXPECT_EQ(1, fiInstallFilter(&params_, LogCapture::Func, &logs_));

  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "Unable to open"));
  // chmod is still attempted, and fails on the missing destination.
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "Unable to stat"));
  EXPECT_EQ(-1, FileMode(target_.Join("cprastertocmd")));
}

TEST_F(InstallTest, MissingFilterDirectoryFails) {
  source_.WriteFile("cprastertocmd", "filter", 0644);
  snprintf(params_.filter_dir, sizeof(params_.filter_dir), "%s",
           target_.Join("missing").c_str());

  EXPECT_EQ(1, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "Unable to create"));
}

TEST_F(InstallTest, StillMarksExistingFilterWhenCopyFails) {
  target_.WriteFile("cprastertocmd", "old filter", 0644);

  EXPECT_EQ(1, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_EQ("old filter", TempDir::ReadFile(target_.Join("cprastertocmd")));
  EXPECT_EQ(0755, FileMode(target_.Join("cprastertocmd")));
}

TEST_F(InstallTest, RefusesToCopyOntoItself) {
  source_.WriteFile("cprastertocmd", "filter", 0644);
  snprintf(params_.filter_dir, sizeof(params_.filter_dir), "%s",
           source_.path().c_str());

  EXPECT_EQ(1, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "are the same file"));
  EXPECT_EQ("filter", TempDir::ReadFile(source_.Join("cprastertocmd")));
}

TEST_F(InstallTest, SyncRequested) {
  source_.WriteFile("cprastertocmd", "filter", 0644);
  params_.sync = 1;

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_DEBUG, "Flushing filesystem buffers"));
}

TEST_F(InstallTest, NoSyncRequested) {
  source_.WriteFile("cprastertocmd", "filter", 0644);

  EXPECT_EQ(0, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_FALSE(logs_.Contains(FI_LOGLEVEL_DEBUG, "Flushing"));
}

TEST_F(InstallTest, EmptyFilterNameFails) {
  params_.filter_name[0] = '\0';

  EXPECT_EQ(1, fiInstallFilter(&params_, LogCapture::Func, &logs_));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "No filter to install"));
}

TEST(CopyFileTest, DirectorySourceFails) {
  TempDir dir;
  LogCapture logs;

  EXPECT_EQ(-1, fiCopyFile(dir.path().c_str(), dir.Join("copy").c_str(),
                           LogCapture::Func, &logs));
  EXPECT_TRUE(logs.Contains(FI_LOGLEVEL_ERROR, "is a directory"));
  EXPECT_EQ(-1, FileMode(dir.Join("copy")));
}

TEST(CopyFileTest, NewFileTakesSourceMode) {
  TempDir dir;
  mode_t old_umask = umask(022);
  std::string src = dir.WriteFile("src", "data", 0750);

  EXPECT_EQ(0, fiCopyFile(src.c_str(), dir.Join("dst").c_str(), NULL, NULL));
  EXPECT_EQ(0750, FileMode(dir.Join("dst")));
  umask(old_umask);
}

TEST(MakeExecutableTest, AddsExecuteBits) {
  TempDir dir;
  std::string file = dir.WriteFile("file", "data", 0640);

  EXPECT_EQ(0, fiMakeExecutable(file.c_str(), NULL, NULL));
  EXPECT_EQ(0751, FileMode(file));
}

TEST(MakeExecutableTest, MissingFileFails) {
  TempDir dir;
  LogCapture logs;

  EXPECT_EQ(-1, fiMakeExecutable(dir.Join("missing").c_str(),
                                 LogCapture::Func, &logs));
  EXPECT_TRUE(logs.Contains(FI_LOGLEVEL_ERROR, "Unable to stat"));
}

}  // namespace
