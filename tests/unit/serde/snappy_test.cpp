/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/snappy.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "networking/ssz_snappy.hpp"
#include "types/blobs_sidecars_by_range_request.hpp"

using histsync::BlobsSidecarsByRangeRequest;
using histsync::SnappyError;
using qtils::ByteVec;

TEST(SnappyTest, Uncompress) {
  // snappy block of "hello hello hello"
  auto compressed =
      ByteVec::fromHex("111468656c6c6f201d06").value();
  ASSERT_OUTCOME_SUCCESS(uncompressed, histsync::snappyUncompress(compressed));
  EXPECT_EQ(std::string(uncompressed.begin(), uncompressed.end()),
            "hello hello hello");

  auto compressed2 = histsync::snappyCompress(uncompressed);
  // compressor may choose different bytes for the same input
  ASSERT_OUTCOME_SUCCESS(uncompressed2,
                         histsync::snappyUncompress(compressed2));
  EXPECT_EQ(uncompressed2, uncompressed);
}

TEST(SnappyTest, UncompressTooLong) {
  ByteVec input(100);
  std::fill(input.begin(), input.end(), 0x2a);
  auto compressed = histsync::snappyCompress(input);
  ASSERT_OUTCOME_ERROR(histsync::snappyUncompress(compressed, 99),
                       SnappyError::UNCOMPRESS_TOO_LONG);
  ASSERT_OUTCOME_SUCCESS(histsync::snappyUncompress(compressed, 100));
}

TEST(SnappyTest, UncompressInvalid) {
  // declares 16 bytes but carries none
  auto compressed = ByteVec::fromHex("10").value();
  ASSERT_OUTCOME_ERROR(histsync::snappyUncompress(compressed),
                       SnappyError::UNCOMPRESS_INVALID);
}

TEST(SszSnappyTest, Request) {
  BlobsSidecarsByRangeRequest request{.start_slot = 10, .count = 64};
  auto encoded = histsync::networking::encodeSszSnappy(request);
  ASSERT_OUTCOME_SUCCESS(
      decoded,
      histsync::networking::decodeSszSnappy<BlobsSidecarsByRangeRequest>(
          encoded));
  EXPECT_EQ(decoded.start_slot, 10);
  EXPECT_EQ(decoded.count, 64);
}
