/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_POSIX_H_
#define S3FCP_UTIL_POSIX_H_

#include <stdint.h>
#include <sys/types.h>

#include <string>

int MakeTcpEndpoint(const std::string &ipv4_address, int portno);

void SafeSleepMs(const unsigned ms);
bool SafeWrite(int fd, const void *buf, size_t nbyte);
bool SafeWriteToFile(const std::string &content,
                     const std::string &path,
                     int mode);

uint64_t MonotonicTimeMs();

#endif  // S3FCP_UTIL_POSIX_H_
