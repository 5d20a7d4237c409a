/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_CONCURRENCY_H_
#define S3FCP_UTIL_CONCURRENCY_H_

#include <pthread.h>

#include <cassert>

#include "util/mutex.h"
#include "util/single_copy.h"

/**
 * A counter confined to [0, maximal_value].  Increment() blocks while the
 * counter is at its maximum.
 *
 * The pipeline uses it as the window of chunks that are dispatched but not yet
 * written: the dispatcher increments before it enqueues a job, the collector
 * decrements after it wrote a chunk.  Assigning a value wakes up all blocked
 * threads, which is how an aborted transfer releases the dispatcher.
 */
template <typename T>
class SynchronizingCounter : SingleCopy {
 public:
  explicit SynchronizingCounter(const T maximal_value)
    : value_(T(0))
    , maximal_value_(maximal_value)
  {
    assert(maximal_value > T(0));
    int retval = pthread_mutex_init(&mutex_, NULL);
    assert(retval == 0);
    retval = pthread_cond_init(&free_slot_, NULL);
    assert(retval == 0);
  }

  ~SynchronizingCounter() {
    pthread_cond_destroy(&free_slot_);
    pthread_mutex_destroy(&mutex_);
  }

  T Increment() {
    MutexLockGuard l(mutex_);
    while (value_ >= maximal_value_)
      pthread_cond_wait(&free_slot_, &mutex_);
    SetValueUnprotected(value_ + T(1));
    return value_;
  }

  T Decrement() {
    MutexLockGuard l(mutex_);
    assert(value_ > T(0));
    SetValueUnprotected(value_ - T(1));
    return value_;
  }

  T Get() const {
    MutexLockGuard l(mutex_);
    return value_;
  }

  SynchronizingCounter<T>& operator=(const T &other) {
    MutexLockGuard l(mutex_);
    SetValueUnprotected(other);
    return *this;
  }

 private:
  void SetValueUnprotected(const T new_value) {
    assert(new_value >= T(0) && new_value <= maximal_value_);
    value_ = new_value;
    if (value_ < maximal_value_)
      pthread_cond_broadcast(&free_slot_);
  }

  T value_;
  const T maximal_value_;
  mutable pthread_mutex_t mutex_;
  pthread_cond_t free_slot_;
};

#endif  // S3FCP_UTIL_CONCURRENCY_H_
