/**
 * This file is part of s3fcp.
 */

#include "testutil.h"

#include <cassert>
#include <string>

#include "network/sink_mem.h"
#include "util/mutex.h"
#include "util/posix.h"

using namespace std;  // NOLINT

string GenerateContent(const uint64_t size, const unsigned seed) {
  string result;
  result.reserve(size);
  uint32_t state = seed;
  for (uint64_t i = 0; i < size; ++i) {
    // Numerical Recipes LCG
    state = state * 1664525u + 1013904223u;
    result.push_back(static_cast<char>(state >> 24));
  }
  return result;
}


MockRangeSource::MockRangeSource(const string &content, bool supports_ranges)
  : content_(content)
  , supports_ranges_(supports_ranges)
  , throttle_ms_(0)
  , probe_failure_(download::kFailOk)
  , probe_failure_times_(0)
  , num_fetches_(0)
  , num_probes_(0)
  , concurrent_fetches_(0)
  , max_concurrent_fetches_(0)
{
  int retval = pthread_mutex_init(&lock_, NULL);
  assert(retval == 0);
}


MockRangeSource::~MockRangeSource() {
  pthread_mutex_destroy(&lock_);
}


void MockRangeSource::FailChunk(
  const uint64_t index,
  const download::Failures failure,
  const unsigned times)
{
  MutexLockGuard guard(lock_);
  scripts_[index].failure = failure;
  scripts_[index].times = times;
}


void MockRangeSource::FailProbe(
  const download::Failures failure,
  const unsigned times)
{
  MutexLockGuard guard(lock_);
  probe_failure_ = failure;
  probe_failure_times_ = times;
}


void MockRangeSource::DelayChunk(const uint64_t index, const unsigned delay_ms)
{
  MutexLockGuard guard(lock_);
  scripts_[index].delay_ms = delay_ms;
}


void MockRangeSource::TruncateChunk(const uint64_t index) {
  MutexLockGuard guard(lock_);
  scripts_[index].truncate = true;
}


unsigned MockRangeSource::GetAttempts(const uint64_t index) {
  MutexLockGuard guard(lock_);
  map<uint64_t, unsigned>::const_iterator i = attempts_.find(index);
  return (i == attempts_.end()) ? 0 : i->second;
}


unsigned MockRangeSource::num_fetches() {
  MutexLockGuard guard(lock_);
  return num_fetches_;
}


unsigned MockRangeSource::num_probes() {
  MutexLockGuard guard(lock_);
  return num_probes_;
}


unsigned MockRangeSource::max_concurrent_fetches() {
  MutexLockGuard guard(lock_);
  return max_concurrent_fetches_;
}


download::Failures MockRangeSource::Probe(
  s3fcp::ObjectDescriptor *descriptor)
{
  MutexLockGuard guard(lock_);
  num_probes_++;
  if (probe_failure_times_ > 0) {
    probe_failure_times_--;
    return probe_failure_;
  }
  descriptor->size = content_.length();
  descriptor->supports_ranges = supports_ranges_;
  descriptor->probed = true;
  return download::kFailOk;
}


download::Failures MockRangeSource::DoFetch(
  const s3fcp::ObjectDescriptor & /* descriptor */,
  const s3fcp::Chunk &chunk,
  s3fcp::MemSink *payload,
  unsigned *throttle_ms)
{
  Script script;
  {
    MutexLockGuard guard(lock_);
    num_fetches_++;
    attempts_[chunk.index]++;
    concurrent_fetches_++;
    if (concurrent_fetches_ > max_concurrent_fetches_)
      max_concurrent_fetches_ = concurrent_fetches_;
    map<uint64_t, Script>::iterator i = scripts_.find(chunk.index);
    if (i != scripts_.end()) {
      script = i->second;
      if (i->second.times > 0)
        i->second.times--;
    }
  }

  if (script.delay_ms > 0)
    SafeSleepMs(script.delay_ms);

  download::Failures result = download::kFailOk;
  if (script.times > 0) {
    result = script.failure;
    *throttle_ms = throttle_ms_;
  } else {
    uint64_t length = chunk.size();
    if (script.truncate)
      length--;
    const string data = content_.substr(chunk.start, length);
    const int64_t written = payload->Write(data.data(), data.length());
    if (written != static_cast<int64_t>(data.length()))
      result = download::kFailLocalIO;
  }

  MutexLockGuard guard(lock_);
  concurrent_fetches_--;
  return result;
}
