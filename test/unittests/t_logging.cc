/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "util/logging.h"

using namespace std;  // NOLINT

namespace {

struct LogRecord {
  LogRecord(LogSource s, int m, const string &t)
    : source(s), mask(m), text(t) { }
  LogSource source;
  int mask;
  string text;
};

vector<LogRecord> *g_records = NULL;

void RecordMessage(const LogSource source, const int mask, const char *msg) {
  g_records->push_back(LogRecord(source, mask, msg));
}

}  // anonymous namespace


class T_Logging : public ::testing::Test {
 protected:
  virtual void SetUp() {
    g_records = &records_;
    SetAltLogFunc(RecordMessage);
    saved_verbosity_ = GetLogVerbosity();
  }

  virtual void TearDown() {
    SetAltLogFunc(NULL);
    SetLogVerbosity(saved_verbosity_);
    g_records = NULL;
  }

  vector<LogRecord> records_;
  LogLevels saved_verbosity_;
};


TEST_F(T_Logging, Format) {
  LogS3fcp(kLogPipeline, kLogStderr, "chunk %d of %s", 3, "object");
  ASSERT_EQ(1U, records_.size());
  EXPECT_EQ(kLogPipeline, records_[0].source);
  EXPECT_EQ(kLogStderr, records_[0].mask);
  EXPECT_EQ("chunk 3 of object", records_[0].text);
}


TEST_F(T_Logging, Verbosity) {
  SetLogVerbosity(kLogNormal);
  EXPECT_EQ(kLogNormal, GetLogVerbosity());
  LogS3fcp(kLogS3fcp, kLogVerboseMsg, "verbose");
  LogS3fcp(kLogS3fcp, kLogInfoMsg, "info");
  LogS3fcp(kLogS3fcp, kLogWarning, "warning");
  LogS3fcp(kLogS3fcp, kLogStderr, "plain");
  ASSERT_EQ(2U, records_.size());
  EXPECT_EQ("warning", records_[0].text);
  EXPECT_EQ("plain", records_[1].text);

  records_.clear();
  SetLogVerbosity(kLogVerbose);
  LogS3fcp(kLogS3fcp, kLogVerboseMsg, "verbose");
  LogS3fcp(kLogS3fcp, kLogInfoMsg, "info");
  EXPECT_EQ(2U, records_.size());

  records_.clear();
  SetLogVerbosity(kLogNone);
  LogS3fcp(kLogS3fcp, kLogWarning, "warning");
  EXPECT_TRUE(records_.empty());
}


TEST_F(T_Logging, ErrorsAndWarnings) {
  PrintError("object not found");
  PrintWarning("slow transfer");
  ASSERT_EQ(2U, records_.size());
  EXPECT_EQ("Error: object not found", records_[0].text);
  EXPECT_EQ(DefaultLogging::error, records_[0].mask);
  EXPECT_EQ("Warning: slow transfer", records_[1].text);
}
