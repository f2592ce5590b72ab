//
// Command-line log function unit tests for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include "filterinst/log.h"

#include <gtest/gtest.h>
#include <string>

namespace {

TEST(CLILogFuncTest, InfoGoesToStdoutVerbatim) {
  fi_cli_log_t cli = {"install-cprastertocmd", FI_LOGLEVEL_INFO};

  testing::internal::CaptureStdout();
  fiCLILogFunc(&cli, FI_LOGLEVEL_INFO, "installing %s to directory %s",
               "cprastertocmd", "/usr/lib/cups/filter");
  EXPECT_EQ("installing cprastertocmd to directory /usr/lib/cups/filter\n",
            testing::internal::GetCapturedStdout());
}

TEST(CLILogFuncTest, ErrorsGoToStderrWithProgramName) {
  fi_cli_log_t cli = {"install-cprastertocmd", FI_LOGLEVEL_INFO};

  testing::internal::CaptureStderr();
  fiCLILogFunc(&cli, FI_LOGLEVEL_ERROR, "Unable to open \"%s\"", "x");
  EXPECT_EQ("install-cprastertocmd: Unable to open \"x\"\n",
            testing::internal::GetCapturedStderr());
}

TEST(CLILogFuncTest, Warnings) {
  fi_cli_log_t cli = {"inst", FI_LOGLEVEL_INFO};

  testing::internal::CaptureStderr();
  fiCLILogFunc(&cli, FI_LOGLEVEL_WARN, "careful");
  EXPECT_EQ("inst: WARNING: careful\n", testing::internal::GetCapturedStderr());
}

TEST(CLILogFuncTest, DebugOnlyWhenVerbose) {
  fi_cli_log_t quiet = {"inst", FI_LOGLEVEL_INFO};
  fi_cli_log_t verbose = {"inst", FI_LOGLEVEL_DEBUG};

  testing::internal::CaptureStdout();
  fiCLILogFunc(&quiet, FI_LOGLEVEL_DEBUG, "hidden");
  fiCLILogFunc(&verbose, FI_LOGLEVEL_DEBUG, "shown %d", 1);
  EXPECT_EQ("DEBUG: shown 1\n", testing::internal::GetCapturedStdout());
}

TEST(CLILogFuncTest, DefaultsWithoutData) {
  testing::internal::CaptureStdout();
  fiCLILogFunc(NULL, FI_LOGLEVEL_DEBUG, "hidden");
  fiCLILogFunc(NULL, FI_LOGLEVEL_INFO, "shown");
  EXPECT_EQ("shown\n", testing::internal::GetCapturedStdout());

  testing::internal::CaptureStderr();
  fiCLILogFunc(NULL, FI_LOGLEVEL_FATAL, "boom");
  EXPECT_EQ("filterinst: boom\n", testing::internal::GetCapturedStderr());
}

}  // namespace
