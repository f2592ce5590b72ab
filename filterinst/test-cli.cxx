//
// Command-line front end unit tests for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include <config.h>
#include "filterinst/cli.h"
#include "filterinst/platform.h"
#include "filterinst/test-helpers.h"

#include <cups/cups.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <string>
#include <vector>

using filterinst_test::FileMode;
using filterinst_test::TempDir;

namespace {

// Mutable argv built from strings, NULL-terminated like the real one.
class Args {
 public:
  explicit Args(const std::vector<std::string> &args) : strings_(args) {
    for (size_t i = 0; i < strings_.size(); i ++)
      argv_.push_back(&strings_[i][0]);
    argv_.push_back(NULL);
  }

  int argc() const { return static_cast<int>(strings_.size()); }
  char **argv() { return &argv_[0]; }

 private:
  std::vector<std::string> strings_;
  std::vector<char *> argv_;
};

// The line the installer prints for the kernel it runs on.
std::string KernelLine() {
  switch (fiGetKernel(NULL, 0, NULL, NULL)) {
    case FI_KERNEL_LINUX:
      return "Detected Linux Kernel\n";
    case FI_KERNEL_DARWIN:
      return "Detected Darwin Kernel\n";
    default:
      return "Assuming Linux Kernel\n";
  }
}

class ParseCommandLineTest : public testing::Test {
 protected:
  ParseCommandLineTest() : num_options_(0), options_(NULL) {}

  ~ParseCommandLineTest() override { cupsFreeOptions(num_options_, options_); }

  fi_cli_status_t Parse(Args &args) {
    return fiParseCommandLine(args.argc(), args.argv(), &num_options_,
                              &options_, &logdata_);
  }

  int num_options_;
  cups_option_t *options_;
  fi_cli_log_t logdata_;
};

TEST_F(ParseCommandLineTest, NoArguments) {
  Args args({"/opt/filters/install-cprastertocmd"});

  EXPECT_EQ(FI_CLI_RUN, Parse(args));
  EXPECT_EQ(0, num_options_);
  EXPECT_STREQ("install-cprastertocmd", logdata_.progname);
  EXPECT_EQ(FI_LOGLEVEL_INFO, logdata_.min_level);
}

TEST_F(ParseCommandLineTest, Options) {
  Args args({"inst", "-o", "filter-dir=/a sync=no", "-o", "source-dir=/b",
             "-v"});

  EXPECT_EQ(FI_CLI_RUN, Parse(args));
  EXPECT_EQ(3, num_options_);
  EXPECT_STREQ("/a", cupsGetOption("filter-dir", num_options_, options_));
  EXPECT_STREQ("no", cupsGetOption("sync", num_options_, options_));
  EXPECT_STREQ("/b", cupsGetOption("source-dir", num_options_, options_));
  EXPECT_EQ(FI_LOGLEVEL_DEBUG, logdata_.min_level);
  EXPECT_STREQ("inst", logdata_.progname);
}

TEST_F(ParseCommandLineTest, HelpGoesToStdout) {
  Args args({"inst", "-h"});

  testing::internal::CaptureStdout();
  EXPECT_EQ(FI_CLI_HELP, Parse(args));
  std::string out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(0u, out.find("Usage: inst [options]\n"));
  EXPECT_NE(std::string::npos, out.find("Exit status is 0"));
}

TEST_F(ParseCommandLineTest, UnknownFlag) {
  Args args({"inst", "-x"});

  testing::internal::CaptureStderr();
  EXPECT_EQ(FI_CLI_ERROR, Parse(args));
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(std::string::npos, err.find("inst: Unknown option \"-x\"."));
  EXPECT_NE(std::string::npos, err.find("Usage: inst"));
}

TEST_F(ParseCommandLineTest, StrayArgument) {
  Args args({"inst", "cprastertocmd"});

  testing::internal::CaptureStderr();
  EXPECT_EQ(FI_CLI_ERROR, Parse(args));
  EXPECT_NE(std::string::npos,
            testing::internal::GetCapturedStderr().find(
                "Unexpected argument \"cprastertocmd\""));
}

TEST_F(ParseCommandLineTest, OptionNeedsValue) {
  Args args({"inst", "-o"});

  testing::internal::CaptureStderr();
  EXPECT_EQ(FI_CLI_ERROR, Parse(args));
  EXPECT_NE(std::string::npos,
            testing::internal::GetCapturedStderr().find(
                "Expected name=value after \"-o\""));
}

TEST_F(ParseCommandLineTest, NoProgramName) {
  char *argv[] = {NULL};

  EXPECT_EQ(FI_CLI_RUN, fiParseCommandLine(0, argv, &num_options_, &options_,
                                           &logdata_));
  EXPECT_STREQ("install-cprastertocmd", logdata_.progname);
}

TEST(InstallerMainTest, HelpExitsZero) {
  Args args({"inst", "-h"});

  testing::internal::CaptureStdout();
  EXPECT_EQ(0, fiInstallerMain(args.argc(), args.argv()));
  testing::internal::GetCapturedStdout();
}

TEST(InstallerMainTest, BadArgumentsExitOne) {
  Args args({"inst", "-q"});

  testing::internal::CaptureStderr();
  EXPECT_EQ(1, fiInstallerMain(args.argc(), args.argv()));
  testing::internal::GetCapturedStderr();
}

TEST(InstallerMainTest, BadOptionValueExitsOne) {
  Args args({"inst", "-o", "sync=sometimes"});

  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  EXPECT_EQ(1, fiInstallerMain(args.argc(), args.argv()));
  testing::internal::GetCapturedStdout();
  EXPECT_NE(std::string::npos,
            testing::internal::GetCapturedStderr().find("Bad value"));
}

TEST(InstallerMainTest, InstallsFilter) {
  TempDir source;
  TempDir target;
  source.WriteFile("cprastertocmd", "filter", 0644);
  Args args({"inst", "-o", "source-dir=" + source.path(), "-o",
             "filter-dir=" + target.path(), "-o", "sync=no"});

  testing::internal::CaptureStdout();
  EXPECT_EQ(0, fiInstallerMain(args.argc(), args.argv()));
  EXPECT_EQ(KernelLine() + "installing cprastertocmd to directory " +
                target.path() + "\n",
            testing::internal::GetCapturedStdout());

  std::string installed = target.Join("cprastertocmd");
  EXPECT_EQ("filter", TempDir::ReadFile(installed));
  EXPECT_EQ(S_IXUSR | S_IXGRP | S_IXOTH,
            FileMode(installed) & (S_IXUSR | S_IXGRP | S_IXOTH));
}

TEST(InstallerMainTest, SourceNextToProgram) {
  TempDir source;
  TempDir target;
  source.WriteFile("cprastertocmd", "filter", 0644);
  Args args({source.Join("install-cprastertocmd"), "-o",
             "filter-dir=" + target.path() + " sync=no"});

  testing::internal::CaptureStdout();
  EXPECT_EQ(0, fiInstallerMain(args.argc(), args.argv()));
  testing::internal::GetCapturedStdout();
  EXPECT_EQ("filter", TempDir::ReadFile(target.Join("cprastertocmd")));
}

TEST(InstallerMainTest, MissingFilterExitsOne) {
  TempDir source;
  TempDir target;
  Args args({"inst", "-o", "source-dir=" + source.path(), "-o",
             "filter-dir=" + target.path(), "-o", "sync=no"});

  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  EXPECT_EQ(1, fiInstallerMain(args.argc(), args.argv()));
  testing::internal::GetCapturedStdout();
  EXPECT_NE(std::string::npos,
            testing::internal::GetCapturedStderr().find("inst: Unable to open"));
}

}  // namespace
