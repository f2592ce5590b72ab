//
// Installer option unit tests for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include <config.h>
#include "filterinst/install.h"
#include "filterinst/platform.h"
#include "filterinst/test-helpers.h"

#include <cups/cups.h>
#include <gtest/gtest.h>
#include <string>

using filterinst_test::LogCapture;

namespace {

class OptionsTest : public testing::Test {
 protected:
  OptionsTest() : num_options_(0), options_(NULL) {}

  ~OptionsTest() override { cupsFreeOptions(num_options_, options_); }

  void Parse(const char *arg) {
    num_options_ = cupsParseOptions(arg, num_options_, &options_);
  }

  int Init(const char *argv0) {
    return fiInstallInit(&params_, argv0, num_options_, options_,
                         LogCapture::Func, &logs_);
  }

  int num_options_;
  cups_option_t *options_;
  fi_install_t params_;
  LogCapture logs_;
};

TEST_F(OptionsTest, Defaults) {
  ASSERT_EQ(0, Init("/opt/driver/filters/install-cprastertocmd"));

  EXPECT_STREQ(FI_FILTER_NAME, params_.filter_name);
  EXPECT_STREQ("/opt/driver/filters", params_.source_dir);
  EXPECT_STREQ(fiFilterDirForKernel(fiGetKernel(NULL, 0, NULL, NULL)),
               params_.filter_dir);
  EXPECT_EQ(1, params_.sync);
  EXPECT_EQ(0u, logs_.Count(FI_LOGLEVEL_ERROR));
}

TEST_F(OptionsTest, ReportsKernel) {
  ASSERT_EQ(0, Init("install-cprastertocmd"));

  ASSERT_EQ(1u, logs_.Count(FI_LOGLEVEL_INFO));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_INFO, " Kernel"));
}

TEST_F(OptionsTest, SourceDirLikeDirname) {
  ASSERT_EQ(0, Init("install-cprastertocmd"));
  EXPECT_STREQ(".", params_.source_dir);

  ASSERT_EQ(0, Init("./install-cprastertocmd"));
  EXPECT_STREQ(".", params_.source_dir);

  ASSERT_EQ(0, Init("/install-cprastertocmd"));
  EXPECT_STREQ("/", params_.source_dir);

  ASSERT_EQ(0, Init("filters//install-cprastertocmd"));
  EXPECT_STREQ("filters", params_.source_dir);

  ASSERT_EQ(0, Init("../filters/install-cprastertocmd/"));
  EXPECT_STREQ("../filters", params_.source_dir);

  ASSERT_EQ(0, Init(""));
  EXPECT_STREQ(".", params_.source_dir);

  ASSERT_EQ(0, Init(NULL));
  EXPECT_STREQ(".", params_.source_dir);
}

TEST_F(OptionsTest, Overrides) {
  Parse("filter-name=rastertofoo source-dir=/src filter-dir=/dst sync=no");
  ASSERT_EQ(0, Init("/usr/bin/install-cprastertocmd"));

  EXPECT_STREQ("rastertofoo", params_.filter_name);
  EXPECT_STREQ("/src", params_.source_dir);
  EXPECT_STREQ("/dst", params_.filter_dir);
  EXPECT_EQ(0, params_.sync);
}

TEST_F(OptionsTest, FilterDirOverrideStillReportsKernel) {
  Parse("filter-dir=/tmp/filters");
  ASSERT_EQ(0, Init("install-cprastertocmd"));

  EXPECT_STREQ("/tmp/filters", params_.filter_dir);
  EXPECT_EQ(1u, logs_.Count(FI_LOGLEVEL_INFO));
}

TEST_F(OptionsTest, SyncValues) {
  Parse("sync=ON");
  ASSERT_EQ(0, Init("x"));
  EXPECT_EQ(1, params_.sync);

  Parse("sync=false");
  ASSERT_EQ(0, Init("x"));
  EXPECT_EQ(0, params_.sync);
}

TEST_F(OptionsTest, BadSyncValue) {
  Parse("sync=maybe");
  EXPECT_EQ(-1, Init("x"));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "Bad value \"maybe\""));
}

TEST_F(OptionsTest, FilterNameWithSlash) {
  Parse("filter-name=../cprastertocmd");
  EXPECT_EQ(-1, Init("x"));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "must not contain"));
}

TEST_F(OptionsTest, EmptyValues) {
  Parse("source-dir=''");
  EXPECT_EQ(-1, Init("x"));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR,
                             "Empty value for option \"source-dir\""));
}

TEST_F(OptionsTest, ValueTooLong) {
  std::string arg = "filter-dir=/" + std::string(2000, 'd');
  Parse(arg.c_str());
  EXPECT_EQ(-1, Init("x"));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "is too long"));
}

TEST_F(OptionsTest, ProgramPathTooLong) {
  std::string argv0 = "/" + std::string(1100, 'p') + "/install-cprastertocmd";
  EXPECT_EQ(-1, Init(argv0.c_str()));
  EXPECT_TRUE(logs_.Contains(FI_LOGLEVEL_ERROR, "Program path is too long"));
}

TEST_F(OptionsTest, ProgramPathTooLongWithSourceDirOption) {
  std::string argv0 = "/" + std::string(1100, 'p') + "/install-cprastertocmd";
  Parse("source-dir=/src");
  ASSERT_EQ(0, Init(argv0.c_str()));
  EXPECT_STREQ("/src", params_.source_dir);
}

}  // namespace
