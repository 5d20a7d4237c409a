/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_MUTEX_H_
#define S3FCP_UTIL_MUTEX_H_

#include <pthread.h>

#include "util/single_copy.h"

/**
 * Scoped RAII wrapper.  Specializations of Enter() and Leave() decide what
 * happens on construction and destruction; the pthread mutex specialization
 * below is the lock guard used throughout the pipeline.
 */
template <typename T>
class RAII : SingleCopy {
 public:
  inline explicit RAII(T &object) : ref_(object)  { Enter(); }
  inline explicit RAII(T *object) : ref_(*object) { Enter(); }
  inline ~RAII()                         { Leave(); }

 protected:
  inline void Enter() { ref_.Lock();   }
  inline void Leave() { ref_.Unlock(); }

 private:
  T &ref_;
};


template <>
inline void RAII<pthread_mutex_t>::Enter() { pthread_mutex_lock(&ref_);   }
template <>
inline void RAII<pthread_mutex_t>::Leave() { pthread_mutex_unlock(&ref_); }
typedef RAII<pthread_mutex_t> MutexLockGuard;

#endif  // S3FCP_UTIL_MUTEX_H_
