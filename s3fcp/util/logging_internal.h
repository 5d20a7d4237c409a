/**
 * This file is part of s3fcp.
 */

// Internal use, include only logging.h!

#ifndef S3FCP_UTIL_LOGGING_INTERNAL_H_
#define S3FCP_UTIL_LOGGING_INTERNAL_H_

#include <cstdarg>
#include <string>

enum LogFacilities {
  kLogDebug = 0x01,
  kLogStdout = 0x02,
  kLogStderr = 0x04,
  kLogSyslog = 0x08,
  kLogSyslogWarn = 0x10,
  kLogSyslogErr = 0x20,
};

/**
 * Default logging facilities
 *
 * Library code logs informational messages and errors to the default
 * facilities:
 *
 * LogS3fcp(kLogS3fcp, DefaultLogging::info, ...)
 *
 * so that the embedding program decides where they end up.  The s3fcp
 * command line tool streams object data to stdout and thus moves both
 * facilities to stderr.
 *
 * The default facilities are kLogStdout and kLogStderr.
 */
struct DefaultLogging {
  /**
   * Change the default logging facilities
   */
  static void Set(LogFacilities info, LogFacilities error);

  static LogFacilities info;  // default kLogStdout
  static LogFacilities error;  // default kLogStderr
};

enum LogFlags {
  kLogNoLinebreak = 0x200,
  kLogShowSource  = 0x400,
};

/**
 * Messages below the verbosity set by SetLogVerbosity() are dropped.  A mask
 * without a level counts as kLogNormal.
 */
enum LogLevels {
  kLogVerbose  = 0x01000,
  kLogInform   = 0x02000,
  kLogNormal   = 0x04000,
  kLogNone     = 0x08000,
};

/**
 * Changes in this enum must be done in logging.cc as well!
 * (see const char *module_names[] = {....})
 */
enum LogSource {
  kLogS3fcp = 1,
  kLogDownload,
  kLogS3,
  kLogHttp,
  kLogPipeline,
  kLogUtility,
  kLogCurl,
  kLogOptions,
};

const int kLogWarning = kLogStderr | kLogShowSource | kLogNormal;
const int kLogInfoMsg = kLogStderr | kLogShowSource | kLogInform;
const int kLogVerboseMsg = kLogStderr | kLogShowSource | kLogVerbose;

void SetLogVerbosity(const LogLevels max_level);
LogLevels GetLogVerbosity();

#ifdef DEBUGMSG
void SetLogDebugFile(const std::string &filename);
#else
#define SetLogDebugFile(filename) ((void)0)
#endif

void SetAltLogFunc(void (*fn)(const LogSource source, const int mask,
                              const char *msg));

void PrintWarning(const std::string &message);
void PrintError(const std::string &message);

#endif  // S3FCP_UTIL_LOGGING_INTERNAL_H_
