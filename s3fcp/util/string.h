/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_STRING_H_
#define S3FCP_UTIL_STRING_H_

#include <stdint.h>

#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

std::string StringifyInt(const int64_t value);
std::string StringifyUint(const uint64_t value);
std::string IsoTimestamp();
std::string IsoTimestamp(const time_t when);
uint64_t String2Uint64(const std::string &value);
bool String2Uint64Parse(const std::string &value, uint64_t *result);
bool HasPrefix(const std::string &str, const std::string &prefix,
               const bool ignore_case);
bool HasSuffix(const std::string &str, const std::string &suffix,
               const bool ignore_case);

std::vector<std::string> SplitString(const std::string &str, char delim);
std::vector<std::string> SplitStringBounded(
  unsigned max_chunks, const std::string &str, char delim);
std::string JoinStrings(const std::vector<std::string> &strings,
                        const std::string &joint);

bool GetLineFile(FILE *f, std::string *line);
std::string Trim(const std::string &raw, bool trim_newline = false);
std::string ToUpper(const std::string &mixed_case);

/**
 * Parses sizes such as "8MB", "16 MiB", "1.5G" or "1024" into a number of
 * bytes.  Decimal suffixes (K, KB, M, MB, ...) are powers of 1000, binary
 * suffixes (KIB, MIB, ...) powers of 1024.  Case and surrounding white space
 * are ignored.  Returns false on malformed input.
 */
bool ParseByteSize(const std::string &size, uint64_t *bytes);

/**
 * Renders a byte count with a binary unit, e.g. "12.5 MiB".
 */
std::string FormatByteSize(const uint64_t bytes);

#endif  // S3FCP_UTIL_STRING_H_
