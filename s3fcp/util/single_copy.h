/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_SINGLE_COPY_H_
#define S3FCP_UTIL_SINGLE_COPY_H_

/**
 * Base class that makes every inheriting class non-copyable.  Pipeline
 * stages, queues and curl handle pools are all shared by pointer.
 */
class SingleCopy {
 protected:
  SingleCopy() {}

 private:
  // Not implemented: copying provokes a linker error
  SingleCopy(const SingleCopy &other);
  SingleCopy& operator=(const SingleCopy &rhs);
};

#endif  // S3FCP_UTIL_SINGLE_COPY_H_
