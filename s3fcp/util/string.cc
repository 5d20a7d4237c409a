/**
 * This file is part of s3fcp.
 *
 * Some common functions for string handling.
 */

#include "util/string.h"

#include <errno.h>
#include <inttypes.h>
#include <stdint.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>

using namespace std;  // NOLINT

namespace {

struct IgnoreCaseComperator {
  IgnoreCaseComperator() {}
  bool operator() (const std::string::value_type a,
                   const std::string::value_type b) const {
    return std::tolower(a) == std::tolower(b);
  }
};

struct SizeSuffix {
  const char *name;
  uint64_t multiplier;
};

const SizeSuffix kSizeSuffixes[] = {
  { "B",   1ull },
  { "K",   1000ull },
  { "KB",  1000ull },
  { "KIB", 1024ull },
  { "M",   1000ull * 1000ull },
  { "MB",  1000ull * 1000ull },
  { "MIB", 1024ull * 1024ull },
  { "G",   1000ull * 1000ull * 1000ull },
  { "GB",  1000ull * 1000ull * 1000ull },
  { "GIB", 1024ull * 1024ull * 1024ull },
  { "T",   1000ull * 1000ull * 1000ull * 1000ull },
  { "TB",  1000ull * 1000ull * 1000ull * 1000ull },
  { "TIB", 1024ull * 1024ull * 1024ull * 1024ull },
};

}  // anonymous namespace


string StringifyInt(const int64_t value) {
  char buffer[48];
  snprintf(buffer, sizeof(buffer), "%" PRId64, value);
  return string(buffer);
}


string StringifyUint(const uint64_t value) {
  char buffer[48];
  snprintf(buffer, sizeof(buffer), "%" PRIu64, value);
  return string(buffer);
}


/**
 * Current time in format YYYYMMDDTHHMMSSZ.  Used in AWS4 requests.
 */
string IsoTimestamp() {
  return IsoTimestamp(time(NULL));
}


string IsoTimestamp(const time_t when) {
  struct tm timestamp;
  gmtime_r(&when, &timestamp);

  char buffer[17];
  snprintf(buffer, sizeof(buffer), "%04d%02d%02dT%02d%02d%02dZ",
           timestamp.tm_year + 1900,
           timestamp.tm_mon + 1,
           timestamp.tm_mday,
           timestamp.tm_hour,
           timestamp.tm_min,
           timestamp.tm_sec);
  return string(buffer);
}


uint64_t String2Uint64(const string &value) {
  uint64_t result;
  if (sscanf(value.c_str(), "%" PRIu64, &result) == 1) {
    return result;
  }
  return 0;
}


/**
 * Parse a string into a a uint64_t.
 *
 * Unlike String2Uint64, this:
 *   - Checks to make sure the full string is parsed
 *   - Can indicate an error occurred.
 *
 * If an error occurs, this returns false and sets errno appropriately.
 */
bool String2Uint64Parse(const string &value, uint64_t *result) {
  if (value.empty() || !isdigit(static_cast<unsigned char>(value[0]))) {
    errno = EINVAL;
    return false;
  }
  char *endptr = NULL;
  errno = 0;
  unsigned long long myval = strtoull(value.c_str(), &endptr, 10);  // NOLINT
  if (endptr != (value.c_str() + value.size())) {
    errno = EINVAL;
    return false;
  }
  if (errno) {
    return false;
  }
  if (result) {
    *result = myval;
  }
  return true;
}


bool HasPrefix(const string &str, const string &prefix,
               const bool ignore_case)
{
  if (prefix.length() > str.length()) return false;

  for (unsigned i = 0, l = prefix.length(); i < l; ++i) {
    if (ignore_case) {
      if (toupper(str[i]) != toupper(prefix[i])) return false;
    } else {
      if (str[i] != prefix[i]) return false;
    }
  }
  return true;
}


bool HasSuffix(const string &str, const string &suffix,
               const bool ignore_case)
{
  if (suffix.size() > str.size()) return false;
  const IgnoreCaseComperator icmp;
  return (ignore_case)
             ? std::equal(suffix.rbegin(), suffix.rend(), str.rbegin(), icmp)
             : std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}


vector<string> SplitString(const string &str, char delim) {
  return SplitStringBounded(0, str, delim);
}


/**
 * Splits at most max_chunks - 1 times; the last chunk carries the rest of
 * the string.  max_chunks == 0 means unbounded.
 */
vector<string> SplitStringBounded(
  unsigned max_chunks, const string &str, char delim)
{
  vector<string> result;

  if (1 == max_chunks) {
    result.push_back(str);
    return result;
  }

  const unsigned size = str.size();
  unsigned marker = 0;
  unsigned chunks = 1;
  for (unsigned i = 0; i < size; ++i) {
    if (str[i] == delim) {
      result.push_back(str.substr(marker, i - marker));
      marker = i + 1;
      if (++chunks == max_chunks) break;
    }
  }

  result.push_back(str.substr(marker));
  return result;
}


string JoinStrings(const vector<string> &strings, const string &joint) {
  string result = "";
  const unsigned size = strings.size();

  if (size > 0) {
    result = strings[0];
    for (unsigned i = 1; i < size; ++i)
      result += joint + strings[i];
  }

  return result;
}


bool GetLineFile(FILE *f, string *line) {
  int retval;
  line->clear();
  while (true) {
    retval = fgetc(f);
    if (ferror(f) && (errno == EINTR)) {
      clearerr(f);
      continue;
    } else if (retval == EOF) {
      break;
    }
    char c = static_cast<char>(retval);
    if (c == '\n') break;
    line->push_back(c);
  }
  return (retval != EOF) || !line->empty();
}


string Trim(const string &raw, bool trim_newline) {
  if (raw.empty()) return "";

  unsigned start_pos = 0;
  for (; (start_pos < raw.length()) &&
         (raw[start_pos] == ' ' || raw[start_pos] == '\t' ||
         (trim_newline && (raw[start_pos] == '\n' || raw[start_pos] == '\r')));
       ++start_pos)
  {
  }
  if (start_pos == raw.length())
    return "";
  unsigned end_pos = raw.length() - 1;
  for (;
       (end_pos > start_pos) &&
         (raw[end_pos] == ' ' || raw[end_pos] == '\t' ||
         (trim_newline && (raw[end_pos] == '\n' || raw[end_pos] == '\r')));
       --end_pos)
  {
  }

  return raw.substr(start_pos, end_pos - start_pos + 1);
}


string ToUpper(const string &mixed_case) {
  string result(mixed_case);
  for (unsigned i = 0, l = result.length(); i < l; ++i) {
    result[i] = static_cast<char>(toupper(result[i]));
  }
  return result;
}


bool ParseByteSize(const string &size, uint64_t *bytes) {
  const string normalized = ToUpper(Trim(size, true));
  if (normalized.empty())
    return false;

  uint64_t plain;
  if (String2Uint64Parse(normalized, &plain)) {
    *bytes = plain;
    return true;
  }

  unsigned pos_suffix = 0;
  while ((pos_suffix < normalized.length()) &&
         !isalpha(static_cast<unsigned char>(normalized[pos_suffix])))
  {
    pos_suffix++;
  }
  const string number = Trim(normalized.substr(0, pos_suffix));
  const string suffix = Trim(normalized.substr(pos_suffix));
  if (number.empty() || suffix.empty())
    return false;

  char *endptr = NULL;
  errno = 0;
  const double value = strtod(number.c_str(), &endptr);
  if ((errno != 0) || (endptr != number.c_str() + number.length()) ||
      (value < 0.0) || !isdigit(static_cast<unsigned char>(number[0])))
  {
    return false;
  }

  const unsigned num_suffixes = sizeof(kSizeSuffixes) / sizeof(SizeSuffix);
  for (unsigned i = 0; i < num_suffixes; ++i) {
    if (suffix == kSizeSuffixes[i].name) {
      *bytes = static_cast<uint64_t>(
        value * static_cast<double>(kSizeSuffixes[i].multiplier));
      return true;
    }
  }
  return false;
}


string FormatByteSize(const uint64_t bytes) {
  const char *units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
  double value = static_cast<double>(bytes);
  unsigned unit = 0;
  while ((value >= 1024.0) && (unit < 4)) {
    value /= 1024.0;
    unit++;
  }
  char buffer[32];
  if (unit == 0) {
    snprintf(buffer, sizeof(buffer), "%" PRIu64 " B", bytes);
  } else {
    snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
  }
  return string(buffer);
}
