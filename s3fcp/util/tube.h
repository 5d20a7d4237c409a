/**
 * This file is part of s3fcp.
 */

#ifndef S3FCP_UTIL_TUBE_H_
#define S3FCP_UTIL_TUBE_H_

#include <pthread.h>
#include <stdint.h>

#include <cassert>
#include <deque>

#include "util/mutex.h"
#include "util/single_copy.h"

/**
 * A bounded, thread-safe FIFO of pointers to ItemT.  The tube does not own
 * its items.
 *
 * Tubes are the hand-off points of the download pipeline: the job tube
 * connects the dispatcher with the workers and the result tube connects the
 * workers with the ordering collector.  Producers block while the tube holds
 * limit items, consumers block while it is empty.
 */
template <class ItemT>
class Tube : SingleCopy {
 public:
  explicit Tube(uint64_t limit) : limit_(limit) {
    assert(limit > 0);
    int retval = pthread_mutex_init(&lock_, NULL);
    assert(retval == 0);
    retval = pthread_cond_init(&cond_not_empty_, NULL);
    assert(retval == 0);
    retval = pthread_cond_init(&cond_not_full_, NULL);
    assert(retval == 0);
  }
  ~Tube() {
    pthread_cond_destroy(&cond_not_empty_);
    pthread_cond_destroy(&cond_not_full_);
    pthread_mutex_destroy(&lock_);
  }

  void EnqueueBack(ItemT *item) {
    assert(item != NULL);
    MutexLockGuard lock_guard(&lock_);
    while (items_.size() >= limit_)
      pthread_cond_wait(&cond_not_full_, &lock_);
    items_.push_back(item);
    pthread_cond_signal(&cond_not_empty_);
  }

  /**
   * Blocks until an item is available.
   */
  ItemT *PopFront() {
    MutexLockGuard lock_guard(&lock_);
    while (items_.empty())
      pthread_cond_wait(&cond_not_empty_, &lock_);
    ItemT *item = items_.front();
    items_.pop_front();
    pthread_cond_signal(&cond_not_full_);
    return item;
  }

  uint64_t size() {
    MutexLockGuard lock_guard(&lock_);
    return items_.size();
  }

 private:
  const uint64_t limit_;
  std::deque<ItemT *> items_;
  pthread_mutex_t lock_;
  pthread_cond_t cond_not_empty_;
  pthread_cond_t cond_not_full_;
};

#endif  // S3FCP_UTIL_TUBE_H_
