/**
 * This file is part of s3fcp.
 */

#include <gtest/gtest.h>

#include <string>

#include "crypto/hash.h"

using namespace std;  // NOLINT

TEST(T_Hash, Sha256) {
  EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
            shash::Sha256String(""));
  EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            shash::Sha256String("abc"));
  const unsigned char buffer[] = { 'a', 'b', 'c' };
  EXPECT_EQ(shash::Sha256String("abc"), shash::Sha256Mem(buffer, 3));
}


// RFC 4231, test case 2
TEST(T_Hash, Hmac256) {
  EXPECT_EQ("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
            shash::Hmac256("Jefe", "what do ya want for nothing?"));
  const string raw = shash::Hmac256("Jefe", "what do ya want for nothing?",
                                    true);
  ASSERT_EQ(32U, raw.length());
  EXPECT_EQ(static_cast<char>(0x5b), raw[0]);
  EXPECT_EQ(static_cast<char>(0x43), raw[31]);
}
