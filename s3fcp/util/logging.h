/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_LOGGING_H_
#define S3FCP_UTIL_LOGGING_H_

#include <string>

// Shared declarations of debug and non-debug logging
#include "util/logging_internal.h"

void vLogS3fcp(const LogSource source, const int mask,
               const char *format, va_list variadic_list);
__attribute__((format(printf, 3, 4)))
void LogS3fcp(const LogSource source, const int mask, const char *format, ...);
// Ensure that pure debug messages are not compiled except in DEBUGMSG mode
#ifndef DEBUGMSG
#define LogS3fcp(source, mask, ...) \
  (((mask) == static_cast<int>(kLogDebug)) ? \
    ((void)0) : LogS3fcp(source, mask, __VA_ARGS__));  // NOLINT
#endif

#endif  // S3FCP_UTIL_LOGGING_H_
