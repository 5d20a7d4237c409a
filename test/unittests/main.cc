/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>
#include <signal.h>

#include "util/logging.h"

int main(int argc, char **argv) {
  // The mock servers write to sockets that clients may have closed already
  signal(SIGPIPE, SIG_IGN);
  DefaultLogging::Set(kLogStderr, kLogStderr);
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::FLAGS_gtest_death_test_style = "threadsafe";
  return RUN_ALL_TESTS();
}
