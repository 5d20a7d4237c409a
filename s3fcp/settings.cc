/**
 * This file is part of s3fcp.
 */

#include "settings.h"

#include <climits>
#include <cstdlib>
#include <string>

#include "options.h"
#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

namespace {

/**
 * Value of the first defined parameter among the candidates
 */
bool GetFirstValue(SimpleOptionsParser *options,
                   const char *key,
                   const char *fallback1,
                   const char *fallback2,
                   string *value)
{
  if (options->GetValue(key, value))
    return true;
  if ((fallback1 != NULL) && options->GetValue(fallback1, value))
    return true;
  if ((fallback2 != NULL) && options->GetValue(fallback2, value))
    return true;
  return false;
}


/**
 * Values beyond UINT_MAX are rejected
 */
bool GetUint(SimpleOptionsParser *options,
             const string &key,
             bool allow_zero,
             unsigned *result,
             string *error)
{
  string value;
  if (!options->GetValue(key, &value))
    return true;
  uint64_t parsed;
  if (!String2Uint64Parse(Trim(value), &parsed) ||
      (parsed > UINT_MAX) || (!allow_zero && (parsed == 0)))
  {
    *error = "invalid value for " + key + ": " + value;
    return false;
  }
  *result = static_cast<unsigned>(parsed);
  return true;
}

}  // anonymous namespace


bool LoadSettings(
  SimpleOptionsParser *options,
  Settings *settings,
  string *error)
{
  string value;

  if (GetFirstValue(options, "S3FCP_S3_REGION", "AWS_REGION",
                    "AWS_DEFAULT_REGION", &value))
  {
    settings->s3.region = value;
  }
  if (options->GetValue("S3FCP_S3_ENDPOINT", &value))
    settings->s3.endpoint = value;
  if (GetFirstValue(options, "S3FCP_S3_ACCESS_KEY", "AWS_ACCESS_KEY_ID",
                    NULL, &value))
  {
    settings->s3.access_key = value;
  }
  if (GetFirstValue(options, "S3FCP_S3_SECRET_KEY", "AWS_SECRET_ACCESS_KEY",
                    NULL, &value))
  {
    settings->s3.secret_key = value;
  }
  if (GetFirstValue(options, "S3FCP_S3_SESSION_TOKEN", "AWS_SESSION_TOKEN",
                    NULL, &value))
  {
    settings->s3.session_token = value;
  }
  if (options->GetValue("S3FCP_S3_DNS_BUCKETS", &value))
    settings->s3.dns_buckets = options->IsOn(value);
  if (!settings->s3.access_key.empty() && settings->s3.secret_key.empty()) {
    *error = "S3 access key given without secret key";
    return false;
  }

  unsigned max_attempts = settings->retry.max_attempts();
  unsigned init_delay_ms = settings->retry.init_delay_ms();
  unsigned max_delay_ms = settings->retry.max_delay_ms();
  double multiplier = settings->retry.multiplier();
  if (!GetUint(options, "S3FCP_MAX_ATTEMPTS", false, &max_attempts, error) ||
      !GetUint(options, "S3FCP_BACKOFF_INIT_MS", true, &init_delay_ms,
               error) ||
      !GetUint(options, "S3FCP_BACKOFF_MAX_MS", true, &max_delay_ms, error))
  {
    return false;
  }
  if (options->GetValue("S3FCP_BACKOFF_MULTIPLIER", &value)) {
    char *end = NULL;
    multiplier = strtod(value.c_str(), &end);
    if (value.empty() || (*end != '\0') || (multiplier < 1.0)) {
      *error = "invalid value for S3FCP_BACKOFF_MULTIPLIER: " + value;
      return false;
    }
  }
  settings->retry = RetryPolicy(max_attempts, init_delay_ms, max_delay_ms,
                                multiplier);

  if (!GetUint(options, "S3FCP_TIMEOUT", false, &settings->http.timeout_sec,
               error) ||
      !GetUint(options, "S3FCP_LOW_SPEED_LIMIT", true,
               &settings->http.low_speed_limit, error))
  {
    return false;
  }

  unsigned concurrency = settings->concurrency;
  if (!GetUint(options, "S3FCP_CONCURRENCY", false, &concurrency, error))
    return false;
  if (concurrency > Pipeline::kMaxConcurrency) {
    *error = "S3FCP_CONCURRENCY exceeds " +
             StringifyUint(Pipeline::kMaxConcurrency);
    return false;
  }
  settings->concurrency = concurrency;
  settings->http.pool_max_handles = settings->concurrency;

  if (options->GetValue("S3FCP_CHUNK_SIZE", &value)) {
    uint64_t chunk_size;
    if (!ParseByteSize(value, &chunk_size) || (chunk_size == 0)) {
      *error = "invalid value for S3FCP_CHUNK_SIZE: " + value;
      return false;
    }
    settings->chunk_size = chunk_size;
  }

  LogS3fcp(kLogOptions, kLogDebug, "region %s, endpoint %s, %s access",
           settings->s3.region.c_str(),
           settings->s3.endpoint.empty() ? "(default)" :
                                           settings->s3.endpoint.c_str(),
           settings->s3.access_key.empty() ? "anonymous" : "signed");
  return true;
}

}  // namespace s3fcp
