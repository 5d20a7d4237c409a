/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>
#include <pthread.h>

#include "util/atomic.h"
#include "util/posix.h"
#include "util/tube.h"

using namespace std;  // NOLINT

namespace {
class DummyItem {
 public:
  DummyItem() : tag_(-1) { }
  int64_t tag() { return tag_; }
  int64_t tag_;
};
}

class T_Tube : public ::testing::Test {
 protected:
  T_Tube() : tube_(10) { }

  Tube<DummyItem> tube_;
};


TEST_F(T_Tube, Fifo) {
  DummyItem a, b, c;
  EXPECT_EQ(0U, tube_.size());
  tube_.EnqueueBack(&a);
  EXPECT_EQ(1U, tube_.size());
  tube_.EnqueueBack(&b);
  tube_.EnqueueBack(&c);
  EXPECT_EQ(3U, tube_.size());

  EXPECT_EQ(&a, tube_.PopFront());
  EXPECT_EQ(&b, tube_.PopFront());
  EXPECT_EQ(1U, tube_.size());
  EXPECT_EQ(&c, tube_.PopFront());
  EXPECT_EQ(0U, tube_.size());
}


namespace {

struct ProducerArgs {
  Tube<DummyItem> *tube;
  DummyItem *items;
  unsigned num_items;
  atomic_int32 num_enqueued;
};

void *MainProducer(void *data) {
  ProducerArgs *args = static_cast<ProducerArgs *>(data);
  for (unsigned i = 0; i < args->num_items; ++i) {
    args->tube->EnqueueBack(&args->items[i]);
    atomic_inc32(&args->num_enqueued);
  }
  return NULL;
}

}  // anonymous namespace

TEST_F(T_Tube, Limit) {
  Tube<DummyItem> tube(2);

  DummyItem items[5];
  for (unsigned i = 0; i < 5; ++i)
    items[i].tag_ = i;
  ProducerArgs args;
  args.tube = &tube;
  args.items = items;
  args.num_items = 5;
  atomic_init32(&args.num_enqueued);

  pthread_t thread_producer;
  ASSERT_EQ(0, pthread_create(&thread_producer, NULL, MainProducer, &args));
  SafeSleepMs(100);
  // The producer blocks on the third item
  EXPECT_EQ(2, atomic_read32(&args.num_enqueued));
  EXPECT_EQ(2U, tube.size());

  for (unsigned i = 0; i < 5; ++i) {
    DummyItem *item = tube.PopFront();
    EXPECT_EQ(static_cast<int64_t>(i), item->tag());
    EXPECT_LE(tube.size(), 2U);
  }
  pthread_join(thread_producer, NULL);
  EXPECT_EQ(5, atomic_read32(&args.num_enqueued));
  EXPECT_EQ(0U, tube.size());
}
