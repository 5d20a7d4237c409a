/**
 * This file is part of s3fcp.
 */

#include "pipeline/chunk_planner.h"

#include <inttypes.h>

#include <vector>

#include "util/logging.h"

using namespace std;  // NOLINT

namespace s3fcp {

bool PlanChunks(const ObjectDescriptor &descriptor,
                const uint64_t chunk_size,
                vector<Chunk> *chunks)
{
  chunks->clear();
  if (chunk_size == 0) {
    LogS3fcp(kLogPipeline, kLogDebug, "invalid chunk size 0");
    return false;
  }

  const uint64_t size = descriptor.size;
  if (size == 0)
    return true;

  if (!descriptor.supports_ranges || (chunk_size >= size)) {
    chunks->push_back(Chunk(0, 0, size - 1));
    return true;
  }

  const uint64_t nchunks = (size - 1) / chunk_size + 1;
  chunks->reserve(nchunks);
  for (uint64_t i = 0; i < nchunks; ++i) {
    const uint64_t start = i * chunk_size;
    uint64_t end = start + chunk_size - 1;
    if (end > size - 1)
      end = size - 1;
    chunks->push_back(Chunk(i, start, end));
  }
  LogS3fcp(kLogPipeline, kLogDebug, "planned %" PRIu64 " chunks of %" PRIu64
           " bytes for %" PRIu64 " bytes", nchunks, chunk_size, size);
  return true;
}

}  // namespace s3fcp
