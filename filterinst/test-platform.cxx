//
// Kernel detection unit tests for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include <config.h>
#include "filterinst/platform.h"
#include "filterinst/test-helpers.h"

#include <gtest/gtest.h>
#include <string.h>
#include <sys/utsname.h>

using filterinst_test::LogCapture;

TEST(KernelFromNameTest, KnownKernels) {
  EXPECT_EQ(FI_KERNEL_LINUX, fiKernelFromName("Linux"));
  EXPECT_EQ(FI_KERNEL_DARWIN, fiKernelFromName("Darwin"));
}

TEST(KernelFromNameTest, ExactMatchOnly) {
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName("linux"));
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName("DARWIN"));
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName("Linux "));
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName("FreeBSD"));
}

TEST(KernelFromNameTest, MissingName) {
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName(NULL));
  EXPECT_EQ(FI_KERNEL_OTHER, fiKernelFromName(""));
}

TEST(KernelStringTest, Names) {
  EXPECT_STREQ("Linux", fiKernelString(FI_KERNEL_LINUX));
  EXPECT_STREQ("Darwin", fiKernelString(FI_KERNEL_DARWIN));
  EXPECT_STREQ("unknown", fiKernelString(FI_KERNEL_OTHER));
}

TEST(FilterDirForKernelTest, Directories) {
  EXPECT_STREQ("/usr/lib/cups/filter", fiFilterDirForKernel(FI_KERNEL_LINUX));
  EXPECT_STREQ("/usr/libexec/cups/filter",
               fiFilterDirForKernel(FI_KERNEL_DARWIN));
  EXPECT_STREQ("/usr/lib/cups/filter", fiFilterDirForKernel(FI_KERNEL_OTHER));
}

TEST(GetKernelTest, MatchesUname) {
  struct utsname uts;
  char sysname[256];
  LogCapture logs;

  ASSERT_EQ(0, uname(&uts));
  EXPECT_EQ(fiKernelFromName(uts.sysname),
            fiGetKernel(sysname, sizeof(sysname), LogCapture::Func, &logs));
  EXPECT_STREQ(uts.sysname, sysname);
  EXPECT_EQ(0u, logs.Count(FI_LOGLEVEL_ERROR));
}

TEST(GetKernelTest, TruncatesName) {
  char sysname[3];

  fiGetKernel(sysname, sizeof(sysname), NULL, NULL);
  EXPECT_LT(strlen(sysname), sizeof(sysname));
}

TEST(ResolveFilterDirTest, Linux) {
  LogCapture logs;

  EXPECT_STREQ("/usr/lib/cups/filter",
               fiResolveFilterDir("Linux", LogCapture::Func, &logs));
  ASSERT_EQ(1u, logs.messages.size());
  EXPECT_EQ(FI_LOGLEVEL_INFO, logs.messages[0].first);
  EXPECT_EQ("Detected Linux Kernel", logs.messages[0].second);
}

TEST(ResolveFilterDirTest, Darwin) {
  LogCapture logs;

  EXPECT_STREQ("/usr/libexec/cups/filter",
               fiResolveFilterDir("Darwin", LogCapture::Func, &logs));
  ASSERT_EQ(1u, logs.messages.size());
  EXPECT_EQ("Detected Darwin Kernel", logs.messages[0].second);
}

TEST(ResolveFilterDirTest, UnknownFallsBackToLinux) {
  LogCapture logs;

  EXPECT_STREQ("/usr/lib/cups/filter",
               fiResolveFilterDir("SunOS", LogCapture::Func, &logs));
  ASSERT_EQ(1u, logs.messages.size());
  EXPECT_EQ("Assuming Linux Kernel", logs.messages[0].second);
}

TEST(ResolveFilterDirTest, RunningKernel) {
  LogCapture logs;
  const char *dir = fiResolveFilterDir(NULL, LogCapture::Func, &logs);

  EXPECT_STREQ(fiFilterDirForKernel(fiGetKernel(NULL, 0, NULL, NULL)), dir);
  EXPECT_EQ(1u, logs.Count(FI_LOGLEVEL_INFO));
}

TEST(ResolveFilterDirTest, NoLogFunction) {
  EXPECT_STREQ("/usr/libexec/cups/filter",
               fiResolveFilterDir("Darwin", NULL, NULL));
}
