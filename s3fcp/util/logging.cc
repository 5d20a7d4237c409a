/**
 * This file is part of s3fcp.
 *
 * LogS3fcp() handles all message output.  It works like printf.
 * It can log to a debug log file, stdout, stderr, and syslog.
 *
 * The syslog and verbosity setters are not thread-safe.  They are meant to be
 * invoked at the very first, single-threaded stage.
 *
 * If DEBUGMSG is undefined, pure debug messages are compiled into no-ops.
 */

#include "util/logging_internal.h"  // NOLINT(build/include)

#include <errno.h>
#include <fcntl.h>
#include <pthread.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

using namespace std;  // NOLINT

LogFacilities DefaultLogging::info = kLogStdout;
LogFacilities DefaultLogging::error = kLogStderr;

void DefaultLogging::Set(LogFacilities info, LogFacilities error) {
  DefaultLogging::info = info;
  DefaultLogging::error = error;
}

namespace {

pthread_mutex_t lock_stdout = PTHREAD_MUTEX_INITIALIZER;
pthread_mutex_t lock_stderr = PTHREAD_MUTEX_INITIALIZER;
#ifdef DEBUGMSG
pthread_mutex_t lock_debug = PTHREAD_MUTEX_INITIALIZER;
FILE *file_debug = NULL;
#endif
const char *module_names[] = { "unknown", "s3fcp", "download", "s3", "http",
  "pipeline", "utility", "curl", "options" };
int syslog_facility = LOG_USER;
int syslog_level = LOG_NOTICE;

LogLevels min_log_level = kLogNormal;
void (*alt_log_func)(const LogSource source, const int mask,
                     const char *msg) = NULL;

}  // anonymous namespace


/**
 * Set the minimum verbosity level.  By default kLogNormal.
 */
void SetLogVerbosity(const LogLevels min_level) {
  min_log_level = min_level;
}


LogLevels GetLogVerbosity() {
  return min_log_level;
}


/**
 * Changes the debug log file from stderr. No effect if DEBUGMSG is undefined.
 */
#ifdef DEBUGMSG
void SetLogDebugFile(const string &filename) {
  if ((file_debug != NULL) && (file_debug != stderr)) {
    fclose(file_debug);
    file_debug = NULL;
  }
  if (filename == "")
    return;

  int fd = open(filename.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0600);
  if ((fd < 0) || ((file_debug = fdopen(fd, "a")) == NULL)) {
    fprintf(stderr, "could not open debug log file %s (%d), aborting\n",
            filename.c_str(), errno);
    abort();
  }
}

#endif


void SetAltLogFunc(void (*fn)(const LogSource source, const int mask,
                              const char *msg))
{
  alt_log_func = fn;
}


/**
 * Logs a message to one or multiple facilities specified by mask.
 *
 * @param[in] source Component that triggers the logging
 * @param[in] mask Bit mask of log facilities and log level
 * @param[in] format Format string
 * @param[in] variadic_list Arguments like vprintf
 */
void vLogS3fcp(const LogSource source, const int mask,
               const char *format, va_list variadic_list)
{
  // Log level check, no flag set in mask means kLogNormal
  int log_level = mask & ((2*kLogNone - 1) ^ (kLogVerbose - 1));
  if (!log_level)
    log_level = kLogNormal;
  if ((log_level < min_log_level) && !(mask & kLogDebug))
    return;

  char *msg = NULL;
  int retval = vasprintf(&msg, format, variadic_list);
  assert(retval != -1);  // else: out of memory

  if (alt_log_func) {
    (*alt_log_func)(source, mask, msg);
    free(msg);
    return;
  }

#ifdef DEBUGMSG
  if (mask & kLogDebug) {
    pthread_mutex_lock(&lock_debug);

    if (file_debug == NULL)
      file_debug = stderr;

    time_t rawtime;
    time(&rawtime);
    struct tm now;
    localtime_r(&rawtime, &now);

    if (file_debug == stderr) pthread_mutex_lock(&lock_stderr);
    fprintf(file_debug, "(%s) %s    [%02d-%02d-%04d %02d:%02d:%02d %s]\n",
            module_names[source], msg,
            (now.tm_mon)+1, now.tm_mday, (now.tm_year)+1900, now.tm_hour,
            now.tm_min, now.tm_sec, now.tm_zone);
    fflush(file_debug);
    if (file_debug == stderr) pthread_mutex_unlock(&lock_stderr);

    pthread_mutex_unlock(&lock_debug);
  }
#endif

  if ((mask & kLogStdout) && (log_level >= min_log_level)) {
    pthread_mutex_lock(&lock_stdout);
    if (mask & kLogShowSource)
      printf("(%s) ", module_names[source]);
    printf("%s", msg);
    if (!(mask & kLogNoLinebreak))
      printf("\n");
    fflush(stdout);
    pthread_mutex_unlock(&lock_stdout);
  }

  if ((mask & kLogStderr) && (log_level >= min_log_level)) {
    pthread_mutex_lock(&lock_stderr);
    if (mask & kLogShowSource)
      fprintf(stderr, "(%s) ", module_names[source]);
    fprintf(stderr, "%s", msg);
    if (!(mask & kLogNoLinebreak))
      fprintf(stderr, "\n");
    fflush(stderr);
    pthread_mutex_unlock(&lock_stderr);
  }

  if (mask & (kLogSyslog | kLogSyslogWarn | kLogSyslogErr)) {
    int level = syslog_level;
    if (mask & kLogSyslogWarn) level = LOG_WARNING;
    if (mask & kLogSyslogErr) level = LOG_ERR;
    syslog(syslog_facility | level, "%s", msg);
  }

  free(msg);
}


void LogS3fcp(const LogSource source, const int mask, const char *format, ...)
{
  va_list variadic_list;
  va_start(variadic_list, format);
  vLogS3fcp(source, mask, format, variadic_list);
  va_end(variadic_list);
}


void PrintError(const string &message) {
  LogS3fcp(kLogS3fcp, DefaultLogging::error, "Error: %s", message.c_str());
}


void PrintWarning(const string &message) {
  LogS3fcp(kLogS3fcp, DefaultLogging::error, "Warning: %s", message.c_str());
}
