/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_EXCEPTION_H_
#define S3FCP_UTIL_EXCEPTION_H_

#include <stdexcept>
#include <string>

#include "util/logging.h"

class ES3fcpException : public std::runtime_error {
 public:
  explicit ES3fcpException(const std::string& what_arg)
      : std::runtime_error(what_arg) {}
};

#define S3FCP_S1(x) #x
#define S3FCP_S2(x) S3FCP_S1(x)
#define S3FCP_SOURCE_LOCATION "PANIC: " __FILE__ " : " S3FCP_S2(__LINE__)
#define PANIC(...) Panic(S3FCP_SOURCE_LOCATION, kLogS3fcp, __VA_ARGS__);

/**
 * Logs the message and aborts.  Builds with S3FCP_RAISE_EXCEPTIONS throw an
 * ES3fcpException instead, which lets unit tests observe the failure.
 */
__attribute__((noreturn))
void Panic(const char *coordinates, const LogSource source, const int mask,
           const char *format, ...);

#endif  // S3FCP_UTIL_EXCEPTION_H_
