/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/parsers.hpp"

#include <gtest/gtest.h>

using histsync::util::parseByteQuantity;
using histsync::util::parseTimeout;

using namespace std::chrono_literals;

TEST(ParsersTest, ByteQuantity) {
  EXPECT_EQ(parseByteQuantity("512"), 512);
  EXPECT_EQ(parseByteQuantity("4 KiB"), 4096);
  EXPECT_EQ(parseByteQuantity("10MB"), 10'000'000);
  EXPECT_EQ(parseByteQuantity(" 1g "), 1ull << 30);
  EXPECT_EQ(parseByteQuantity("2T"), 2ull << 40);
}

TEST(ParsersTest, ByteQuantityMalformed) {
  EXPECT_FALSE(parseByteQuantity(""));
  EXPECT_FALSE(parseByteQuantity("MB"));
  EXPECT_FALSE(parseByteQuantity("-1"));
  EXPECT_FALSE(parseByteQuantity("10 parsecs"));
  // overflow
  EXPECT_FALSE(parseByteQuantity("99999999999 TB"));
}

TEST(ParsersTest, Timeout) {
  EXPECT_EQ(parseTimeout("500ms"), 500ms);
  EXPECT_EQ(parseTimeout("10s"), 10s);
  EXPECT_EQ(parseTimeout("2 min"), 2min);
  EXPECT_EQ(parseTimeout("7"), 7s);
  EXPECT_FALSE(parseTimeout("soon"));
  EXPECT_FALSE(parseTimeout("5h"));
}
