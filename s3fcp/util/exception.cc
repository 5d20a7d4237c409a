/**
 * This file is part of s3fcp.
 */

#include "util/exception.h"

#include <cassert>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include "util/logging.h"

void Panic(const char* coordinates, const LogSource source, const int mask,
           const char* format, ...) {
  char* msg = NULL;
  va_list variadic_list;

  va_start(variadic_list, format);
  int retval = vasprintf(&msg, format, variadic_list);
  assert(retval != -1);  // else: out of memory
  va_end(variadic_list);

  char* msg_with_coordinates = NULL;
  retval = asprintf(&msg_with_coordinates, "%s\n%s", coordinates, msg);
  if (retval != -1) {
    free(msg);
    msg = msg_with_coordinates;
  }

#ifdef S3FCP_RAISE_EXCEPTIONS
  (void) source;
  (void) mask;
  const std::string what(msg);
  free(msg);
  throw ES3fcpException(what);
#else
  LogS3fcp(source, mask, "%s", msg);
  abort();
#endif
}
