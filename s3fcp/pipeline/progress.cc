/**
 * This file is part of s3fcp.
 */

#include "pipeline/progress.h"

#include <cstdio>
#include <string>

#include "util/logging.h"
#include "util/posix.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace s3fcp {

const unsigned StderrProgress::kDefaultIntervalMs;


StderrProgress::StderrProgress(
  const uint64_t total_bytes,
  const unsigned interval_ms)
  : total_bytes_(total_bytes)
  , interval_ms_(interval_ms)
  , start_ms_(MonotonicTimeMs())
{
  atomic_init64(&bytes_done_);
  atomic_init64(&last_print_ms_);
}


string StderrProgress::Render(const uint64_t now_ms) {
  const uint64_t done = bytes_done();
  const double percent = (total_bytes_ == 0) ?
    100.0 : (100.0 * static_cast<double>(done) / total_bytes_);
  const uint64_t elapsed_ms = now_ms - start_ms_;
  const uint64_t throughput =
    (elapsed_ms == 0) ? 0 : (done * 1000 / elapsed_ms);

  char percent_str[16];
  snprintf(percent_str, sizeof(percent_str), "%.1f%%", percent);
  return FormatByteSize(done) + " / " + FormatByteSize(total_bytes_) +
         " (" + percent_str + ") " + FormatByteSize(throughput) + "/s";
}


void StderrProgress::Report(const uint64_t bytes_delta) {
  atomic_xadd64(&bytes_done_, static_cast<int64_t>(bytes_delta));

  const int64_t now = static_cast<int64_t>(MonotonicTimeMs());
  const int64_t last = atomic_read64(&last_print_ms_);
  if (now - last < static_cast<int64_t>(interval_ms_))
    return;
  // Only one of the concurrent reporters prints
  if (!atomic_cas64(&last_print_ms_, last, now))
    return;
  LogS3fcp(kLogS3fcp, kLogStderr | kLogNoLinebreak, "\r%s   ",
           Render(now).c_str());
}


void StderrProgress::Finish() {
  LogS3fcp(kLogS3fcp, kLogStderr, "\r%s   ",
           Render(MonotonicTimeMs()).c_str());
  LogS3fcp(kLogS3fcp, kLogStderr, "Download complete");
}

}  // namespace s3fcp
