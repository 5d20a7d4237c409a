/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_PIPELINE_CHUNK_PLANNER_H_
#define S3FCP_PIPELINE_CHUNK_PLANNER_H_

#include <stdint.h>

#include <vector>

#include "object.h"

namespace s3fcp {

/**
 * Partitions [0, descriptor.size) into chunks of chunk_size bytes, the last
 * one possibly shorter.  An empty object has no chunks.  Objects without
 * range support, and objects not larger than one chunk, are a single chunk.
 *
 * Returns false (and leaves chunks empty) if chunk_size is zero.
 */
bool PlanChunks(const ObjectDescriptor &descriptor,
                const uint64_t chunk_size,
                std::vector<Chunk> *chunks);

}  // namespace s3fcp

#endif  // S3FCP_PIPELINE_CHUNK_PLANNER_H_
