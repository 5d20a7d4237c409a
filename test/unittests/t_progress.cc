/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>

#include <string>

#include "pipeline/progress.h"
#include "util/posix.h"

using namespace std;  // NOLINT

namespace s3fcp {

TEST(T_Progress, Render) {
  StderrProgress progress(2048, 1000000);
  EXPECT_EQ(0U, progress.bytes_done());
  progress.Report(1024);
  EXPECT_EQ(1024U, progress.bytes_done());
  const string line = progress.Render(MonotonicTimeMs() + 1000);
  EXPECT_EQ(0U, line.find("1.0 KiB / 2.0 KiB (50.0%) ")) << line;
  EXPECT_NE(string::npos, line.find("/s")) << line;
  progress.Report(1024);
  progress.Finish();
  EXPECT_EQ(2048U, progress.bytes_done());
}


TEST(T_Progress, EmptyObject) {
  StderrProgress progress(0);
  const string line = progress.Render(MonotonicTimeMs());
  EXPECT_EQ(0U, line.find("0 B / 0 B (100.0%)")) << line;
}


TEST(T_Progress, NullProgress) {
  NullProgress progress;
  progress.Report(100);
  progress.Finish();
}

}  // namespace s3fcp
