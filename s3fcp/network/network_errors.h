/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_NETWORK_NETWORK_ERRORS_H_
#define S3FCP_NETWORK_NETWORK_ERRORS_H_

namespace download {

/**
 * Possible return values of metadata probes, range fetches and the pipeline
 * as a whole.  Only kFailTransient is eligible for a retry.
 */
enum Failures {
  kFailOk = 0,
  kFailNotFound,
  kFailAccessDenied,
  kFailUnsupported,
  kFailTransient,
  kFailPermanent,
  kFailOrderingViolation,
  kFailLocalIO,
  kFailBadUrl,
  kFailCanceled,

  kFailNumEntries
};  // Failures


inline bool IsRetryable(const Failures error) {
  return error == kFailTransient;
}

inline const char *Code2Ascii(const Failures error) {
  const char *texts[kFailNumEntries + 1];
  texts[0] = "OK";
  texts[1] = "object not found";
  texts[2] = "access denied";
  texts[3] = "object size cannot be determined";
  texts[4] = "transient network or server failure";
  texts[5] = "permanent failure";
  texts[6] = "chunk ordering violation";
  texts[7] = "local I/O failure";
  texts[8] = "malformed URL";
  texts[9] = "request canceled";
  texts[10] = "no text";
  return texts[error];
}

}  // namespace download

#endif  // S3FCP_NETWORK_NETWORK_ERRORS_H_
