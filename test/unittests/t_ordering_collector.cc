/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "network/sink_mem.h"
#include "object.h"
#include "pipeline/chunk_planner.h"
#include "pipeline/ordering_collector.h"
#include "testutil.h"

using namespace std;  // NOLINT

namespace s3fcp {

class T_OrderingCollector : public ::testing::Test {
 protected:
  virtual void SetUp() {
    content_ = GenerateContent(25);
    ObjectDescriptor descriptor;
    descriptor.size = content_.length();
    descriptor.supports_ranges = true;
    ASSERT_TRUE(PlanChunks(descriptor, 10, &chunks_));
  }

  MemSink *Payload(const Chunk &chunk) {
    MemSink *payload = new MemSink();
    payload->Write(content_.data() + chunk.start, chunk.size());
    return payload;
  }

  string Output() {
    return string(reinterpret_cast<char *>(output_.data()), output_.pos());
  }

  string content_;
  vector<Chunk> chunks_;
  MemSink output_;
};


TEST_F(T_OrderingCollector, InOrder) {
  OrderingCollector collector(&output_, chunks_.size());
  for (unsigned i = 0; i < chunks_.size(); ++i) {
    EXPECT_EQ(download::kFailOk, collector.Accept(i, Payload(chunks_[i])));
    EXPECT_EQ(0U, collector.buffered());
  }
  EXPECT_TRUE(collector.IsComplete());
  EXPECT_EQ(content_, Output());
  EXPECT_EQ(25U, collector.bytes_written());
  EXPECT_EQ(0U, collector.max_buffered());
}


TEST_F(T_OrderingCollector, BufferUntilGapCloses) {
  OrderingCollector collector(&output_, chunks_.size());
  EXPECT_EQ(download::kFailOk, collector.Accept(2, Payload(chunks_[2])));
  EXPECT_EQ(1U, collector.buffered());
  EXPECT_EQ(0U, output_.pos());
  EXPECT_EQ(0U, collector.next_expected());

  EXPECT_EQ(download::kFailOk, collector.Accept(0, Payload(chunks_[0])));
  EXPECT_EQ(1U, collector.buffered());
  EXPECT_EQ(10U, output_.pos());
  EXPECT_EQ(1U, collector.next_expected());

  EXPECT_EQ(download::kFailOk, collector.Accept(1, Payload(chunks_[1])));
  EXPECT_EQ(0U, collector.buffered());
  EXPECT_EQ(3U, collector.next_expected());
  EXPECT_TRUE(collector.IsComplete());
  EXPECT_EQ(content_, Output());
  EXPECT_EQ(1U, collector.max_buffered());
}


TEST_F(T_OrderingCollector, AllPermutations) {
  vector<Chunk> chunks;
  const string content = GenerateContent(50, 7);
  ObjectDescriptor descriptor;
  descriptor.size = content.length();
  descriptor.supports_ranges = true;
  ASSERT_TRUE(PlanChunks(descriptor, 10, &chunks));
  ASSERT_EQ(5U, chunks.size());

  vector<unsigned> order;
  for (unsigned i = 0; i < chunks.size(); ++i)
    order.push_back(i);
  unsigned num_permutations = 0;
  do {
    MemSink output;
    OrderingCollector collector(&output, chunks.size());
    for (unsigned i = 0; i < order.size(); ++i) {
      const Chunk &chunk = chunks[order[i]];
      MemSink *payload = new MemSink();
      payload->Write(content.data() + chunk.start, chunk.size());
      ASSERT_EQ(download::kFailOk, collector.Accept(chunk.index, payload));
    }
    EXPECT_TRUE(collector.IsComplete());
    EXPECT_EQ(content,
              string(reinterpret_cast<char *>(output.data()), output.pos()));
    num_permutations++;
  } while (next_permutation(order.begin(), order.end()));
  EXPECT_EQ(120U, num_permutations);
}


TEST_F(T_OrderingCollector, DuplicateBuffered) {
  OrderingCollector collector(&output_, chunks_.size());
  EXPECT_EQ(download::kFailOk, collector.Accept(2, Payload(chunks_[2])));
  EXPECT_EQ(download::kFailOrderingViolation,
            collector.Accept(2, Payload(chunks_[2])));
  // Sticky failure, nothing written afterwards
  EXPECT_EQ(download::kFailOrderingViolation,
            collector.Accept(0, Payload(chunks_[0])));
  EXPECT_EQ(0U, output_.pos());
  EXPECT_FALSE(collector.IsComplete());
}


TEST_F(T_OrderingCollector, DuplicateWritten) {
  OrderingCollector collector(&output_, chunks_.size());
  EXPECT_EQ(download::kFailOk, collector.Accept(0, Payload(chunks_[0])));
  EXPECT_EQ(download::kFailOrderingViolation,
            collector.Accept(0, Payload(chunks_[0])));
  EXPECT_EQ(10U, output_.pos());
  EXPECT_EQ(download::kFailOrderingViolation, collector.failure());
}


TEST_F(T_OrderingCollector, OutOfBounds) {
  OrderingCollector collector(&output_, chunks_.size());
  EXPECT_EQ(download::kFailOrderingViolation,
            collector.Accept(3, Payload(chunks_[2])));
}


TEST_F(T_OrderingCollector, ShortWrite) {
  MemSink small_output(10, 15);
  OrderingCollector collector(&small_output, chunks_.size());
  EXPECT_EQ(download::kFailOk, collector.Accept(0, Payload(chunks_[0])));
  EXPECT_EQ(download::kFailLocalIO, collector.Accept(1, Payload(chunks_[1])));
  EXPECT_EQ(download::kFailLocalIO, collector.Accept(2, Payload(chunks_[2])));
  EXPECT_EQ(10U, collector.bytes_written());
}


TEST_F(T_OrderingCollector, BufferedPayloadsReleased) {
  // Leak checkers catch payloads that stay in the buffer
  OrderingCollector *collector = new OrderingCollector(&output_, 3);
  EXPECT_EQ(download::kFailOk, collector->Accept(1, Payload(chunks_[1])));
  EXPECT_EQ(download::kFailOk, collector->Accept(2, Payload(chunks_[2])));
  EXPECT_EQ(2U, collector->buffered());
  delete collector;
}

}  // namespace s3fcp
