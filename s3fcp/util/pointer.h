/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_POINTER_H_
#define S3FCP_UTIL_POINTER_H_

#include <cstdlib>

#include "util/single_copy.h"

/**
 * Owning pointer for pre-C++11 code paths.  Used for chunk payloads that
 * travel between the worker threads and the ordering collector.
 */
template <class T>
class UniquePtr : SingleCopy {
 public:
  inline UniquePtr() : ref_(NULL) { }
  inline explicit UniquePtr(T *ref) : ref_(ref) { }
  inline ~UniquePtr() { delete ref_; }

  inline T* operator->() const { return ref_; }
  inline T& operator*() const { return *ref_; }
  // NOLINTNEXTLINE(misc-unconventional-assign-operator)
  inline UniquePtr<T>& operator=(T *ref) {
    if (ref_ != ref) {
      delete ref_;
      ref_ = ref;
    }
    return *this;
  }
  inline T* weak_ref() const { return ref_; }
  inline bool IsValid() const { return (ref_ != NULL); }
  inline T* Release() { T* r = ref_; ref_ = NULL; return r; }
  inline void Destroy() { delete ref_; ref_ = NULL; }

 private:
  T *ref_;
};

#endif  // S3FCP_UTIL_POINTER_H_
