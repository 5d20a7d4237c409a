/**
 * This file is part of s3fcp.
 */

#ifndef TEST_UNITTESTS_TESTUTIL_H_
#define TEST_UNITTESTS_TESTUTIL_H_

#include <pthread.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "network/network_errors.h"
#include "network/range_source.h"
#include "object.h"

/**
 * Deterministic pseudo-random bytes, so that misplaced chunks show up
 */
std::string GenerateContent(const uint64_t size, const unsigned seed = 42);


/**
 * A range source over an in-memory object.  Failures and delays can be
 * scripted per chunk index; every attempt is counted.
 */
class MockRangeSource : public s3fcp::RangeSource {
 public:
  explicit MockRangeSource(const std::string &content,
                           bool supports_ranges = true);
  virtual ~MockRangeSource();

  virtual download::Failures Probe(s3fcp::ObjectDescriptor *descriptor);
  virtual std::string Describe() { return "mock range source"; }

  /**
   * The next `times` attempts to fetch chunk `index` fail with `failure`
   */
  void FailChunk(const uint64_t index,
                 const download::Failures failure,
                 const unsigned times);
  void FailProbe(const download::Failures failure, const unsigned times);
  void DelayChunk(const uint64_t index, const unsigned delay_ms);
  /**
   * The payload of chunk index is one byte short
   */
  void TruncateChunk(const uint64_t index);
  void set_throttle_ms(const unsigned value) { throttle_ms_ = value; }

  unsigned GetAttempts(const uint64_t index);
  unsigned num_fetches();
  unsigned num_probes();
  unsigned max_concurrent_fetches();

 protected:
  virtual download::Failures DoFetch(const s3fcp::ObjectDescriptor &descriptor,
                                     const s3fcp::Chunk &chunk,
                                     s3fcp::MemSink *payload,
                                     unsigned *throttle_ms);

 private:
  struct Script {
    Script() : failure(download::kFailOk), times(0), delay_ms(0),
               truncate(false) { }
    download::Failures failure;
    unsigned times;
    unsigned delay_ms;
    bool truncate;
  };

  const std::string content_;
  const bool supports_ranges_;
  unsigned throttle_ms_;
  pthread_mutex_t lock_;
  std::map<uint64_t, Script> scripts_;
  std::map<uint64_t, unsigned> attempts_;
  download::Failures probe_failure_;
  unsigned probe_failure_times_;
  unsigned num_fetches_;
  unsigned num_probes_;
  unsigned concurrent_fetches_;
  unsigned max_concurrent_fetches_;
};

#endif  // TEST_UNITTESTS_TESTUTIL_H_
