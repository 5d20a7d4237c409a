/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>

#include <string>

#include "c_http_server.h"
#include "network/http_client.h"
#include "network/range_source_http.h"
#include "network/sink_mem.h"
#include "object.h"
#include "testutil.h"

using namespace std;  // NOLINT

namespace s3fcp {

static const int kObjectServerPort = 8082;
static const int kGatewayPort = 8085;

class T_RangeSourceHttp : public ::testing::Test {
 protected:
  T_RangeSourceHttp()
    : content_(GenerateContent(1000))
    , server_(kObjectServerPort, content_)
    , http_client_(download::HttpClient::Options())
    , source_(&http_client_)
  {
    descriptor_.backend = kBackendHttp;
    descriptor_.url = server_.url();
  }

  string PayloadString() {
    return string(reinterpret_cast<char *>(payload_.data()), payload_.pos());
  }

  string content_;
  MockObjectServer server_;
  download::HttpClient http_client_;
  HttpRangeSource source_;
  ObjectDescriptor descriptor_;
  MemSink payload_;
};


TEST_F(T_RangeSourceHttp, RangeAdvertisement) {
  EXPECT_TRUE(HttpRangeSource::IsRangeAdvertisement("bytes"));
  EXPECT_TRUE(HttpRangeSource::IsRangeAdvertisement("Bytes"));
  EXPECT_TRUE(HttpRangeSource::IsRangeAdvertisement("foo, bytes"));
  EXPECT_FALSE(HttpRangeSource::IsRangeAdvertisement("none"));
  EXPECT_FALSE(HttpRangeSource::IsRangeAdvertisement(""));
}


TEST_F(T_RangeSourceHttp, Probe) {
  EXPECT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  EXPECT_TRUE(descriptor_.probed);
  EXPECT_TRUE(descriptor_.supports_ranges);
  EXPECT_EQ(1000U, descriptor_.size);
  EXPECT_EQ("HEAD", server_.last_request().method);
  EXPECT_EQ("/object", server_.last_request().path);
}


TEST_F(T_RangeSourceHttp, ProbeWithoutRanges) {
  server_.set_accept_ranges(false);
  EXPECT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  EXPECT_TRUE(descriptor_.probed);
  EXPECT_FALSE(descriptor_.supports_ranges);
  EXPECT_EQ(1000U, descriptor_.size);
}


TEST_F(T_RangeSourceHttp, ProbeFailures) {
  server_.InjectFailures(1, 404);
  EXPECT_EQ(download::kFailNotFound, source_.Probe(&descriptor_));
  EXPECT_FALSE(descriptor_.probed);

  server_.InjectFailures(1, 403);
  EXPECT_EQ(download::kFailAccessDenied, source_.Probe(&descriptor_));

  server_.InjectFailures(1, 503);
  EXPECT_EQ(download::kFailTransient, source_.Probe(&descriptor_));
  EXPECT_EQ(download::kFailOk, source_.Probe(&descriptor_));
}


TEST_F(T_RangeSourceHttp, ProbeUnreachable) {
  descriptor_.url = "http://127.0.0.1:1/object";
  EXPECT_EQ(download::kFailTransient, source_.Probe(&descriptor_));
}


TEST_F(T_RangeSourceHttp, FetchRange) {
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  Chunk chunk(3, 300, 399);
  EXPECT_EQ(download::kFailOk, source_.Fetch(descriptor_, chunk, &payload_));
  EXPECT_EQ(content_.substr(300, 100), PayloadString());
  EXPECT_EQ("bytes=300-399", server_.last_request().GetHeader("Range"));

  // The last chunk can be shorter
  Chunk last(9, 900, 999);
  EXPECT_EQ(download::kFailOk, source_.Fetch(descriptor_, last, &payload_));
  EXPECT_EQ(content_.substr(900), PayloadString());
}


TEST_F(T_RangeSourceHttp, FetchWholeObject) {
  server_.set_accept_ranges(false);
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  Chunk chunk(0, 0, 999);
  EXPECT_EQ(download::kFailOk, source_.Fetch(descriptor_, chunk, &payload_));
  EXPECT_EQ(content_, PayloadString());
  EXPECT_EQ("", server_.last_request().GetHeader("Range"));
}


TEST_F(T_RangeSourceHttp, PartialChunkWithoutRanges) {
  server_.set_accept_ranges(false);
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  Chunk chunk(0, 0, 99);
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor_, chunk, &payload_));
  EXPECT_EQ(1, server_.num_processed_requests());
}


TEST_F(T_RangeSourceHttp, RangeIgnored) {
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  // The origin answers with the full object despite the Range header
  server_.set_accept_ranges(false);
  Chunk chunk(0, 0, 99);
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor_, chunk, &payload_));
}


TEST_F(T_RangeSourceHttp, FetchOutsideObject) {
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  Chunk chunk(10, 1000, 1099);
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor_, chunk, &payload_));
  EXPECT_EQ(1, server_.num_processed_requests());
}


TEST_F(T_RangeSourceHttp, FetchFailures) {
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  Chunk chunk(1, 100, 199);
  unsigned throttle_ms = 0;

  server_.InjectFailures(1, 503, "2");
  EXPECT_EQ(download::kFailTransient,
            source_.Fetch(descriptor_, chunk, &payload_, &throttle_ms));
  EXPECT_EQ(2000U, throttle_ms);

  server_.InjectFailures(1, 500);
  EXPECT_EQ(download::kFailTransient,
            source_.Fetch(descriptor_, chunk, &payload_, &throttle_ms));
  EXPECT_EQ(0U, throttle_ms);

  // Not found in the middle of a transfer is not retried
  server_.InjectFailures(1, 404);
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor_, chunk, &payload_, &throttle_ms));

  server_.InjectFailures(1, 403);
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor_, chunk, &payload_, &throttle_ms));

  EXPECT_EQ(download::kFailOk,
            source_.Fetch(descriptor_, chunk, &payload_, &throttle_ms));
  EXPECT_EQ(content_.substr(100, 100), PayloadString());
}


TEST_F(T_RangeSourceHttp, TruncatedBody) {
  ASSERT_EQ(download::kFailOk, source_.Probe(&descriptor_));
  server_.set_truncate_bodies(true);
  Chunk chunk(1, 100, 199);
  EXPECT_EQ(download::kFailTransient,
            source_.Fetch(descriptor_, chunk, &payload_));
}

TEST_F(T_RangeSourceHttp, WrongContentRange) {
  MockGateway gateway(kGatewayPort);
  ObjectDescriptor descriptor;
  descriptor.backend = kBackendHttp;
  descriptor.url = "http://127.0.0.1:" + StringifyInt(kGatewayPort) + "/obj";
  descriptor.size = 100;
  descriptor.supports_ranges = true;
  descriptor.probed = true;
  Chunk chunk(1, 10, 19);

  gateway.next_response_.code = 206;
  gateway.next_response_.reason = "Partial Content";
  gateway.next_response_.body = "AAAAAAAAAA";
  gateway.next_response_.AddHeader("Content-Range", "bytes 0-9/100");
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor, chunk, &payload_));
  EXPECT_EQ("bytes=10-19", gateway.last_request_.GetHeader("Range"));

  gateway.next_response_.headers.clear();
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor, chunk, &payload_));

  gateway.next_response_.AddHeader("Content-Range", "bytes ten-19/100");
  EXPECT_EQ(download::kFailPermanent,
            source_.Fetch(descriptor, chunk, &payload_));

  gateway.next_response_.headers.clear();
  gateway.next_response_.AddHeader("Content-Range", "bytes 10-19/100");
  EXPECT_EQ(download::kFailOk, source_.Fetch(descriptor, chunk, &payload_));
  EXPECT_EQ("AAAAAAAAAA", PayloadString());
}

}  // namespace s3fcp
