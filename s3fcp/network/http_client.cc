/**
 * This file is part of s3fcp.
 *
 * Blocking HTTP transfers on top of libcurl easy handles.  Every worker
 * thread performs its own transfer; the only shared state is the pool of
 * idle handles, which keeps connections alive between chunk requests.
 */

#include "network/http_client.h"

#include <inttypes.h>
#include <pthread.h>

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <string>

#include "network/sink.h"
#include "util/exception.h"
#include "util/logging.h"
#include "util/mutex.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace download {

const unsigned HttpClient::kDefault429ThrottleMs = 250;
const unsigned HttpClient::kMax429ThrottleMs = 10000;

namespace {

pthread_once_t curl_init_once = PTHREAD_ONCE_INIT;

void InitCurlOnce() {
  CURLcode retval = curl_global_init(CURL_GLOBAL_ALL);
  if (retval != CURLE_OK) {
    PANIC(kLogStderr | kLogSyslogErr, "failed to initialize libcurl (%d)",
          static_cast<int>(retval));
  }
}

}  // anonymous namespace


/**
 * Called by curl for every HTTP header.
 */
static size_t CallbackCurlHeader(void *ptr, size_t size, size_t nmemb,
                                 void *info_link)
{
  const size_t num_bytes = size*nmemb;
  const string header_line(static_cast<const char *>(ptr), num_bytes);
  JobInfo *info = static_cast<JobInfo *>(info_link);

  // A status line starts a new response (redirects, 100 Continue)
  if (HasPrefix(header_line, "HTTP/", false)) {
    size_t i = header_line.find(' ');
    if (i == string::npos)
      return 0;
    for (; (i < header_line.length()) && (header_line[i] == ' '); ++i) {}
    if (header_line.length() < i + 3) {
      LogS3fcp(kLogCurl, kLogDebug, "invalid HTTP response '%s'",
               header_line.c_str());
      info->error_code = kFailPermanent;
      return 0;
    }

    info->http_code = HttpClient::ParseHttpCode(&header_line[i]);
    info->has_content_length = false;
    info->content_length = 0;
    info->accept_ranges.clear();
    info->content_range.clear();
    info->throttle_ms = 0;
    info->error_code = kFailOk;

    const int http_class = info->http_code / 100;
    if (info->http_code < 0) {
      info->error_code = kFailPermanent;
      return 0;
    } else if (http_class == 1) {
      return num_bytes;
    } else if (http_class == 2) {
      if ((info->expected_http_code != 0) &&
          (info->http_code != info->expected_http_code))
      {
        LogS3fcp(kLogCurl, kLogDebug, "unexpected HTTP status %d for %s "
                 "(expected %d)", info->http_code, info->url.c_str(),
                 info->expected_http_code);
        info->error_code = kFailPermanent;
        return 0;
      }
      return num_bytes;
    } else if (http_class == 3) {
      // libcurl follows the redirect if CURLOPT_FOLLOWLOCATION is set,
      // otherwise the transfer ends with the 3XX response
      info->error_code = kFailPermanent;
      return num_bytes;
    }

    LogS3fcp(kLogCurl, kLogDebug, "http status error code for %s: %s",
             info->url.c_str(), Trim(header_line, true).c_str());
    info->error_code = HttpClient::ClassifyHttpCode(info->http_code);
    if (info->http_code == 429)
      info->throttle_ms = HttpClient::kDefault429ThrottleMs;
    // Continue to collect headers such as Retry-After, the body is dropped
    return num_bytes;
  }

  if (HasPrefix(header_line, "CONTENT-LENGTH:", true)) {
    const string value = Trim(header_line.substr(15), true);
    uint64_t length;
    if (!String2Uint64Parse(value, &length)) {
      LogS3fcp(kLogCurl, kLogDebug, "invalid Content-Length '%s' from %s",
               value.c_str(), info->url.c_str());
      return num_bytes;
    }
    info->has_content_length = true;
    info->content_length = length;

    if (info->head_request || (info->error_code != kFailOk) ||
        (info->http_code / 100 != 2))
    {
      return num_bytes;
    }
    if ((info->max_body_size > 0) && (length > info->max_body_size)) {
      LogS3fcp(kLogCurl, kLogDebug, "response of %s announces %" PRIu64
               " bytes, expected at most %" PRIu64, info->url.c_str(), length,
               info->max_body_size);
      info->error_code = kFailTransient;
      return 0;
    }
    if ((info->sink != NULL) && info->sink->RequiresReserve() &&
        !info->sink->Reserve(length))
    {
      LogS3fcp(kLogCurl, kLogDebug | kLogSyslogErr,
               "resource %s too large to store in memory (%" PRIu64 ")",
               info->url.c_str(), length);
      info->error_code = kFailLocalIO;
      return 0;
    }
  } else if (HasPrefix(header_line, "ACCEPT-RANGES:", true)) {
    info->accept_ranges = Trim(header_line.substr(14), true);
  } else if (HasPrefix(header_line, "CONTENT-RANGE:", true)) {
    info->content_range = Trim(header_line.substr(14), true);
  } else if (info->error_code == kFailTransient) {
    const unsigned throttle_ms =
      HttpClient::ParseThrottleIndicator(header_line);
    if (throttle_ms > 0)
      info->throttle_ms = throttle_ms;
  }

  return num_bytes;
}


/**
 * Called by curl for every received data chunk.
 */
static size_t CallbackCurlData(void *ptr, size_t size, size_t nmemb,
                               void *info_link)
{
  const size_t num_bytes = size*nmemb;
  JobInfo *info = static_cast<JobInfo *>(info_link);

  if (num_bytes == 0)
    return 0;

  // Body of a followed redirect
  if ((info->http_code / 100 == 3) && (info->error_code == kFailPermanent))
    return num_bytes;
  // Error documents are not written to the sink
  if (info->error_code != kFailOk)
    return 0;
  if (info->sink == NULL) {
    info->error_code = kFailLocalIO;
    return 0;
  }

  if ((info->max_body_size > 0) &&
      (info->body_size + num_bytes > info->max_body_size))
  {
    LogS3fcp(kLogCurl, kLogDebug, "response of %s exceeds %" PRIu64 " bytes",
             info->url.c_str(), info->max_body_size);
    info->error_code = kFailTransient;
    return 0;
  }

  int64_t written = info->sink->Write(ptr, num_bytes);
  if (written < 0 || static_cast<uint64_t>(written) != num_bytes) {
    LogS3fcp(kLogCurl, kLogDebug,
             "Failed to perform write of %zu bytes to sink %s with errno %ld",
             num_bytes, info->sink->Describe().c_str(),
             static_cast<long>(written));  // NOLINT
    info->error_code = kFailLocalIO;
    return 0;
  }
  info->body_size += num_bytes;

  return num_bytes;
}


#ifdef DEBUGMSG
static int CallbackCurlDebug(
  CURL * /* handle */,
  curl_infotype type,
  char *data,
  size_t size,
  void * /* clientp */)
{
  string prefix;
  switch (type) {
    case CURLINFO_TEXT:
      prefix = "{info} ";
      break;
    case CURLINFO_HEADER_IN:
      prefix = "{header/recv} ";
      break;
    case CURLINFO_HEADER_OUT:
      prefix = "{header/sent} ";
      break;
    default:
      // Payload is not logged
      return 0;
  }
  const string msg = Trim(string(data, size), true);
  LogS3fcp(kLogCurl, kLogDebug, "%s%s", prefix.c_str(), msg.c_str());
  return 0;
}
#endif


HttpClient::HttpClient(const Options &options) : options_(options) {
  pthread_once(&curl_init_once, InitCurlOnce);
  int retval = pthread_mutex_init(&lock_pool_, NULL);
  assert(retval == 0);
}


HttpClient::~HttpClient() {
  assert(pool_handles_inuse_.empty());
  for (set<CURL *>::iterator i = pool_handles_idle_.begin(),
       iEnd = pool_handles_idle_.end(); i != iEnd; ++i)
  {
    curl_easy_cleanup(*i);
  }
  pthread_mutex_destroy(&lock_pool_);
}


/**
 * -1 of digits is not a valid Http return code
 */
int HttpClient::ParseHttpCode(const char digits[3]) {
  int result = 0;
  int factor = 100;
  for (int i = 0; i < 3; ++i) {
    if ((digits[i] < '0') || (digits[i] > '9'))
      return -1;
    result += (digits[i] - '0') * factor;
    factor /= 10;
  }
  return result;
}


Failures HttpClient::ClassifyHttpCode(const int http_code) {
  switch (http_code) {
    case 401:
    case 403:
      return kFailAccessDenied;
    case 404:
    case 410:
      return kFailNotFound;
    case 408:  // request timeout
    case 429:  // rate throttling
      return kFailTransient;
    case 501:
      return kFailPermanent;
    default:
      break;
  }
  if ((http_code / 100) == 5)
    return kFailTransient;
  return kFailPermanent;
}


Failures HttpClient::ClassifyCurlCode(const int curl_error) {
  switch (curl_error) {
    case CURLE_OK:
      return kFailOk;
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
      return kFailBadUrl;
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_HTTP2:
      return kFailTransient;
    case CURLE_TOO_MANY_REDIRECTS:
      return kFailPermanent;
    case CURLE_SSL_CACERT_BADFILE:
      LogS3fcp(kLogCurl, kLogDebug | kLogSyslogErr,
               "Failed to load certificate bundle. "
               "CURL_CA_BUNDLE might point to the wrong location.");
      return kFailPermanent;
    // As of curl 7.62.0, CURLE_SSL_CACERT is the same as
    // CURLE_PEER_FAILED_VERIFICATION
    case CURLE_PEER_FAILED_VERIFICATION:
      LogS3fcp(kLogCurl, kLogDebug | kLogSyslogErr,
               "invalid SSL certificate of remote host");
      return kFailPermanent;
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_WRITE_ERROR:
      return kFailLocalIO;
    default:
      LogS3fcp(kLogCurl, kLogDebug, "unexpected curl error (%d): %s",
               curl_error,
               curl_easy_strerror(static_cast<CURLcode>(curl_error)));
      return kFailTransient;
  }
}


/**
 * Parses Retry-After and X-Retry-In headers attached to HTTP 429 and 503
 * responses.  Returns 0 if the header line is not a throttle indicator.
 */
unsigned HttpClient::ParseThrottleIndicator(const string &header_line) {
  string value_str;
  if (HasPrefix(header_line, "retry-after:", true))
    value_str = header_line.substr(12);
  if (HasPrefix(header_line, "x-retry-in:", true))
    value_str = header_line.substr(11);

  value_str = Trim(value_str, true /* trim_newline */);
  if (value_str.empty())
    return 0;

  const uint64_t value_numeric = String2Uint64(value_str);
  const uint64_t value_ms =
    HasSuffix(value_str, "ms", true /* ignore_case */) ?
      value_numeric : (value_numeric * 1000);
  return static_cast<unsigned>(
    std::min(value_ms, static_cast<uint64_t>(kMax429ThrottleMs)));
}


bool HttpClient::ParseContentRange(const string &value,
                                   uint64_t *first,
                                   uint64_t *last,
                                   uint64_t *total)
{
  const string trimmed = Trim(value, true /* trim_newline */);
  if (!HasPrefix(trimmed, "bytes ", true /* ignore_case */))
    return false;
  const string spec = Trim(trimmed.substr(6));
  const size_t pos_dash = spec.find('-');
  const size_t pos_slash = spec.find('/');
  if ((pos_dash == string::npos) || (pos_slash == string::npos) ||
      (pos_dash > pos_slash))
  {
    return false;
  }

  if (!String2Uint64Parse(spec.substr(0, pos_dash), first) ||
      !String2Uint64Parse(spec.substr(pos_dash + 1, pos_slash - pos_dash - 1),
                          last) ||
      (*last < *first))
  {
    return false;
  }
  const string total_str = spec.substr(pos_slash + 1);
  if (total_str == "*") {
    *total = 0;
    return true;
  }
  if (!String2Uint64Parse(total_str, total) || (*last >= *total))
    return false;
  return true;
}


/**
 * Gets an idle CURL handle from the pool. Creates a new one if necessary.
 */
CURL *HttpClient::AcquireCurlHandle() {
  CURL *handle;

  MutexLockGuard guard(lock_pool_);
  if (pool_handles_idle_.empty()) {
    handle = curl_easy_init();
    if (handle == NULL)
      PANIC(kLogStderr | kLogSyslogErr, "failed to create curl handle");

    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, CallbackCurlHeader);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, CallbackCurlData);
  } else {
    handle = *(pool_handles_idle_.begin());
    pool_handles_idle_.erase(pool_handles_idle_.begin());
  }

  pool_handles_inuse_.insert(handle);
  return handle;
}


void HttpClient::ReleaseCurlHandle(CURL *handle) {
  MutexLockGuard guard(lock_pool_);
  set<CURL *>::iterator elem = pool_handles_inuse_.find(handle);
  assert(elem != pool_handles_inuse_.end());

  if (pool_handles_idle_.size() >= options_.pool_max_handles) {
    curl_easy_cleanup(*elem);
  } else {
    pool_handles_idle_.insert(*elem);
  }

  pool_handles_inuse_.erase(elem);
}


/**
 * HTTP request options: set the URL, the headers, the byte range and
 * timeouts.  A reused handle keeps the options of its previous transfer, so
 * every per-request option is set explicitly.
 */
void HttpClient::InitializeRequest(JobInfo *info, CURL *handle,
                                   struct curl_slist **header_list)
{
  info->error_code = kFailOk;
  info->http_code = -1;
  info->has_content_length = false;
  info->content_length = 0;
  info->accept_ranges.clear();
  info->content_range.clear();
  info->throttle_ms = 0;
  info->body_size = 0;

  *header_list = NULL;
  for (unsigned i = 0; i < info->headers.size(); ++i)
    *header_list = curl_slist_append(*header_list, info->headers[i].c_str());

  if ((info->range_start >= 0) && (info->range_end >= info->range_start)) {
    char byte_range_array[100];
    if (snprintf(byte_range_array, sizeof(byte_range_array),
                 "%" PRId64 "-%" PRId64,
                 info->range_start, info->range_end) >= 100)
    {
      PANIC(kLogStderr, "invalid byte range");
    }
    curl_easy_setopt(handle, CURLOPT_RANGE, byte_range_array);
  } else {
    curl_easy_setopt(handle, CURLOPT_RANGE, NULL);
  }

  curl_easy_setopt(handle, CURLOPT_URL, info->url.c_str());
  curl_easy_setopt(handle, CURLOPT_WRITEHEADER, static_cast<void *>(info));
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, static_cast<void *>(info));
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, *header_list);
  if (info->head_request) {
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  }
  if (options_.follow_redirects) {
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 4L);
  } else {
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
  }
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(options_.connect_timeout_sec));  // NOLINT
  curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT,
                   static_cast<long>(options_.low_speed_limit));  // NOLINT
  curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME,
                   static_cast<long>(options_.timeout_sec));  // NOLINT
  curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
#ifdef DEBUGMSG
  curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L);
  curl_easy_setopt(handle, CURLOPT_DEBUGFUNCTION, CallbackCurlDebug);
#endif
}


/**
 * Combines the curl result with the failure already detected by the
 * callbacks.
 */
void HttpClient::VerifyAndFinalize(const int curl_error, JobInfo *info) {
  switch (curl_error) {
    case CURLE_OK:
      break;
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_WRITE_ERROR:
      // Error set by callback
      if (info->error_code == kFailOk)
        info->error_code = kFailLocalIO;
      break;
    default:
      info->error_code = ClassifyCurlCode(curl_error);
  }

  if (info->error_code != kFailOk) {
    LogS3fcp(kLogCurl, kLogDebug, "%s %s failed: curl error %d, "
             "http code %d, %s", info->head_request ? "HEAD" : "GET",
             info->url.c_str(), curl_error, info->http_code,
             Code2Ascii(info->error_code));
  }
}


Failures HttpClient::Perform(JobInfo *info) {
  CURL *handle = AcquireCurlHandle();
  struct curl_slist *header_list = NULL;
  InitializeRequest(info, handle, &header_list);

  const int curl_error = curl_easy_perform(handle);
  VerifyAndFinalize(curl_error, info);

  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, NULL);
  curl_slist_free_all(header_list);
  ReleaseCurlHandle(handle);
  return info->error_code;
}

}  // namespace download
