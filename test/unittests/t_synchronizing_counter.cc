/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>
#include <pthread.h>

#include "util/atomic.h"
#include "util/concurrency.h"
#include "util/posix.h"


struct thread_args {
  atomic_int32                    state;
  SynchronizingCounter<uint64_t> *counter;
};


class T_SynchronizingCounter : public ::testing::Test {
 protected:
  void StartThread(SynchronizingCounter<uint64_t> *counter,
                   void *(*thread_function)(void*))
  {
    atomic_init32(&args_.state);
    args_.counter = counter;
    const int r = pthread_create(&thread_, NULL, thread_function, &args_);
    ASSERT_EQ(0, r) << "Failed to spawn thread";
  }

  void JoinThread() {
    pthread_join(thread_, NULL);
  }

  int32_t state() { return atomic_read32(&args_.state); }

  pthread_t thread_;
  thread_args args_;
};


TEST_F(T_SynchronizingCounter, Initialize) {
  SynchronizingCounter<uint64_t> counter(4);
  EXPECT_EQ(0U, counter.Get());
}


TEST_F(T_SynchronizingCounter, IncrementDecrement) {
  SynchronizingCounter<uint64_t> counter(100);
  EXPECT_EQ(1U, counter.Increment());
  EXPECT_EQ(2U, counter.Increment());
  EXPECT_EQ(2U, counter.Get());
  EXPECT_EQ(1U, counter.Decrement());
  counter = 100;
  EXPECT_EQ(100U, counter.Get());
  EXPECT_EQ(99U, counter.Decrement());
}


void *thread_increment_beyond_max(void *arg) {
  thread_args *args = static_cast<thread_args *>(arg);
  atomic_write32(&args->state, 1);
  args->counter->Increment();
  atomic_write32(&args->state, 2);
  return NULL;
}

TEST_F(T_SynchronizingCounter, BlockAtMaximum) {
  SynchronizingCounter<uint64_t> counter(2);
  counter.Increment();
  counter.Increment();

  StartThread(&counter, thread_increment_beyond_max);
  SafeSleepMs(100);
  EXPECT_EQ(1, state()) << "increment did not block";
  EXPECT_EQ(2U, counter.Get());

  counter.Decrement();
  JoinThread();
  EXPECT_EQ(2, state());
  EXPECT_EQ(2U, counter.Get());
}


TEST_F(T_SynchronizingCounter, AssignmentReleasesBlocked) {
  SynchronizingCounter<uint64_t> counter(1);
  counter.Increment();

  StartThread(&counter, thread_increment_beyond_max);
  SafeSleepMs(100);
  EXPECT_EQ(1, state());

  counter = 0;
  JoinThread();
  EXPECT_EQ(2, state());
  EXPECT_EQ(1U, counter.Get());
}
