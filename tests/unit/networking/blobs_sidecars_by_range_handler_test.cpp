/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <boost/asio/steady_timer.hpp>
#include <qtils/test/outcome.hpp>

#include "mock/app/configuration_mock.hpp"
#include "mock/blockchain/blob_sidecar_source_mock.hpp"
#include "mock/clock/manual_clock.hpp"
#include "mock/networking/rpc_stream_fake.hpp"
#include "networking/blobs_sidecars_by_range_handler.hpp"
#include "networking/impl/rate_limiter_impl.hpp"
#include "networking/request_context.hpp"
#include "testutil/coro.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

using histsync::BlobsSidecar;
using histsync::BlobsSidecars;
using histsync::BlobsSidecarsByRangeRequest;
using histsync::BlockHash;
using histsync::kZeroHash;
using histsync::Slot;
using histsync::app::Configuration;
using histsync::app::ConfigurationMock;
using histsync::blockchain::BlobSidecarSourceMock;
using histsync::clock::ManualSteadyClock;
using histsync::networking::BlobsSidecarsByRangeHandler;
using histsync::networking::ContextError;
using histsync::networking::RateLimiterImpl;
using histsync::networking::RequestContext;
using histsync::networking::ResponseCode;
using histsync::networking::RpcError;
using histsync::networking::RpcStreamFake;
using testing::_;
using testing::Return;
using testing::ReturnRef;

using namespace std::chrono_literals;

class BlobsSidecarsByRangeHandlerTest : public testing::Test {
 public:
  static constexpr auto kProtocol =
      "/eth2/beacon_chain/req/blobs_sidecars_by_range/1/ssz_snappy";
  static constexpr auto kPeer = "peer";

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    sync_config.block_batch_limit = 64;
    sync_config.block_batch_limit_burst_factor = 2;
    sync_config.max_request_blob_sidecars = 128;
    sync_config.resp_timeout = 10s;
    sync_config.ttfb_timeout = 5s;
    sync_config.write_timeout = 7s;

    app_config = std::make_shared<ConfigurationMock>();
    EXPECT_CALL(*app_config, sync()).WillRepeatedly(ReturnRef(sync_config));

    source = std::make_shared<BlobSidecarSourceMock>();
    ON_CALL(*source, blobsSidecarsBySlot(_))
        .WillByDefault(Return(BlobsSidecars{}));

    clock = std::make_shared<ManualSteadyClock>();
    rate_limiter = std::make_shared<RateLimiterImpl>(logsys, app_config, clock);
    rate_limiter->registerTopic(kProtocol);

    handler = std::make_shared<BlobsSidecarsByRangeHandler>(
        logsys, app_config, source, rate_limiter);

    stream = std::make_shared<RpcStreamFake>(kPeer, kProtocol);
  }

  static BlobsSidecar sidecar(Slot slot, const BlockHash &root) {
    BlobsSidecar sidecar;
    sidecar.beacon_block_slot = slot;
    sidecar.beacon_block_root = root;
    return sidecar;
  }

  outcome::result<void> handle(
      Slot start_slot,
      uint64_t count,
      std::shared_ptr<RequestContext> ctx = nullptr) {
    if (not ctx) {
      ctx = RequestContext::background(io_context);
    }
    return testutil::runCoro(
        *io_context,
        handler->handle(ctx,
                        BlobsSidecarsByRangeRequest{
                            .start_slot = start_slot,
                            .count = count,
                        },
                        stream));
  }

  int64_t remaining() {
    return rate_limiter->quotaFor(kPeer, kProtocol).value()->remaining(kPeer);
  }

  qtils::SharedRef<histsync::log::LoggingSystem> logsys =
      testutil::prepareLoggers();

  std::shared_ptr<boost::asio::io_context> io_context =
      std::make_shared<boost::asio::io_context>();

  Configuration::SyncConfig sync_config;
  std::shared_ptr<ConfigurationMock> app_config;
  std::shared_ptr<BlobSidecarSourceMock> source;
  std::shared_ptr<ManualSteadyClock> clock;
  std::shared_ptr<RateLimiterImpl> rate_limiter;
  std::shared_ptr<BlobsSidecarsByRangeHandler> handler;
  std::shared_ptr<RpcStreamFake> stream;
};

/**
 * @given sidecars at slots 5 and 6 (two at slot 6), nothing at slot 7
 * @when requesting 3 slots from slot 5
 * @then three chunks are written in slot order, the peer is charged for
 * three units, and the stream is closed without error frames
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, ServesRange) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(5))
      .WillOnce(Return(BlobsSidecars{sidecar(5, "a"_root)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(6))
      .WillOnce(
          Return(BlobsSidecars{sidecar(6, "b"_root), sidecar(6, "c"_root)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(7))
      .WillOnce(Return(BlobsSidecars{}));

  ASSERT_OUTCOME_SUCCESS(handle(5, 3));

  ASSERT_EQ(stream->chunks.size(), 3);
  EXPECT_EQ(stream->chunks[0].beacon_block_root, BlockHash{"a"_root});
  EXPECT_EQ(stream->chunks[1].beacon_block_root, BlockHash{"b"_root});
  EXPECT_EQ(stream->chunks[2].beacon_block_root, BlockHash{"c"_root});
  EXPECT_TRUE(stream->errors.empty());
  EXPECT_EQ(stream->close_count, 1);
  EXPECT_EQ(remaining(), 128 - 3);

  // read deadline is ttfb, first write deadline is the whole response
  ASSERT_EQ(stream->read_deadlines.size(), 1);
  EXPECT_EQ(stream->read_deadlines[0], 5s);
  ASSERT_FALSE(stream->write_deadlines.empty());
  EXPECT_EQ(stream->write_deadlines[0], 10s);
  // then each chunk has its own write deadline
  EXPECT_EQ(stream->write_deadlines.size(), 1 + 3);
  EXPECT_EQ(stream->write_deadlines.back(), 7s);
}

/**
 * @given slot holding a zero-root placeholder between two real sidecars
 * @when requesting the slot
 * @then only real sidecars are written and charged
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, SkipsZeroRoot) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(10))
      .WillOnce(Return(BlobsSidecars{
          sidecar(10, "a"_root), sidecar(10, kZeroHash), sidecar(10, "b"_root)}));

  ASSERT_OUTCOME_SUCCESS(handle(10, 1));

  ASSERT_EQ(stream->chunks.size(), 2);
  EXPECT_EQ(stream->chunks[0].beacon_block_root, BlockHash{"a"_root});
  EXPECT_EQ(stream->chunks[1].beacon_block_root, BlockHash{"b"_root});
  EXPECT_EQ(remaining(), 128 - 2);
  EXPECT_EQ(stream->close_count, 1);
}

/**
 * @given storage failing at the second slot of the range
 * @when requesting the range
 * @then sidecars of the first slot are written, followed by a server error
 * frame, and the storage error is returned
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, StorageFailure) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(20))
      .WillOnce(Return(BlobsSidecars{sidecar(20, "a"_root)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(21))
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_CALL(*source, blobsSidecarsBySlot(22)).Times(0);

  ASSERT_OUTCOME_ERROR(handle(20, 3), testutil::DummyError::ERROR);

  EXPECT_EQ(stream->chunks.size(), 1);
  ASSERT_EQ(stream->errors.size(), 1);
  EXPECT_EQ(stream->errors[0].code, ResponseCode::SERVER_ERROR);
  EXPECT_EQ(stream->errors[0].message,
            make_error_code(RpcError::GENERIC).message());
  EXPECT_EQ(stream->close_count, 0);
}

/**
 * @given stream failing to write the second chunk
 * @when serving a slot with two sidecars
 * @then a server error frame follows and the write error is returned
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, WriteFailure) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(3))
      .WillOnce(
          Return(BlobsSidecars{sidecar(3, "a"_root), sidecar(3, "b"_root)}));
  stream->fail_chunk_at = 1;

  ASSERT_OUTCOME_ERROR(handle(3, 1), RpcError::GENERIC);

  EXPECT_EQ(stream->chunks.size(), 1);
  ASSERT_EQ(stream->errors.size(), 1);
  EXPECT_EQ(stream->errors[0].code, ResponseCode::SERVER_ERROR);
  EXPECT_EQ(stream->close_count, 0);
}

/**
 * @given a range much longer than the response cap, with sidecars everywhere
 * @when requesting the range
 * @then exactly max_request_blob_sidecars non-empty slots are served
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, ResponseCap) {
  sync_config.max_request_blob_sidecars = 2;
  EXPECT_CALL(*source, blobsSidecarsBySlot(_))
      .WillRepeatedly([](Slot slot) -> outcome::result<BlobsSidecars> {
        return BlobsSidecars{sidecar(slot, "a"_root)};
      });

  ASSERT_OUTCOME_SUCCESS(handle(0, 1000));

  ASSERT_EQ(stream->chunks.size(), 2);
  EXPECT_EQ(stream->chunks[0].beacon_block_slot, 0);
  EXPECT_EQ(stream->chunks[1].beacon_block_slot, 1);
  EXPECT_EQ(stream->close_count, 1);
}

/**
 * @given range of empty slots and zero-root placeholders only
 * @when requesting it
 * @then nothing is written or charged and the stream is closed
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, NothingToServe) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(1))
      .WillOnce(Return(BlobsSidecars{sidecar(1, kZeroHash)}));

  ASSERT_OUTCOME_SUCCESS(handle(0, 4));

  EXPECT_TRUE(stream->chunks.empty());
  EXPECT_TRUE(stream->errors.empty());
  EXPECT_EQ(remaining(), 128);
  EXPECT_EQ(stream->close_count, 1);
}

/**
 * @given request of zero slots
 * @when handling it
 * @then storage is not touched and the stream is closed
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, EmptyRange) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(_)).Times(0);

  ASSERT_OUTCOME_SUCCESS(handle(100, 0));

  EXPECT_EQ(stream->close_count, 1);
}

/**
 * @given request whose end overflows the slot type
 * @when handling it
 * @then the range ends at the largest slot
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, RangeEndSaturates) {
  EXPECT_CALL(*source, blobsSidecarsBySlot(UINT64_MAX - 1))
      .WillOnce(Return(BlobsSidecars{sidecar(UINT64_MAX - 1, "a"_root)}));

  ASSERT_OUTCOME_SUCCESS(handle(UINT64_MAX - 1, 10));

  EXPECT_EQ(stream->chunks.size(), 1);
  EXPECT_EQ(stream->close_count, 1);
}

/**
 * @given peer whose budget is below one batch
 * @when it requests a range
 * @then a rate limited frame is written and nothing is served
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, RateLimited) {
  rate_limiter->debit(*stream, 128 - 63);
  EXPECT_CALL(*source, blobsSidecarsBySlot(_)).Times(0);

  ASSERT_OUTCOME_ERROR(handle(0, 5), RpcError::RATE_LIMITED);

  EXPECT_TRUE(stream->chunks.empty());
  ASSERT_EQ(stream->errors.size(), 1);
  EXPECT_EQ(stream->errors[0].code, ResponseCode::RESOURCE_UNAVAILABLE);
  EXPECT_EQ(stream->errors[0].message,
            make_error_code(RpcError::RATE_LIMITED).message());
  EXPECT_EQ(stream->close_count, 0);
}

/**
 * @given peer with nearly exhausted burst, so the handler waits for tokens
 * after the first slot
 * @when the request is canceled during the wait
 * @then the handler stops with the cancellation error and writes nothing more
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, CanceledWhileThrottled) {
  // one token per second: the wait after the first slot is long
  sync_config.block_batch_limit = 1;
  sync_config.block_batch_limit_burst_factor = 2;
  rate_limiter = std::make_shared<RateLimiterImpl>(logsys, app_config, clock);
  rate_limiter->registerTopic(kProtocol);
  handler = std::make_shared<BlobsSidecarsByRangeHandler>(
      logsys, app_config, source, rate_limiter);

  EXPECT_CALL(*source, blobsSidecarsBySlot(0))
      .WillOnce(Return(BlobsSidecars{sidecar(0, "a"_root)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(1)).Times(0);

  auto ctx = RequestContext::background(io_context);
  boost::asio::steady_timer canceler{*io_context, 50ms};
  canceler.async_wait([ctx](const boost::system::error_code &ec) {
    if (not ec) {
      ctx->cancel();
    }
  });

  ASSERT_OUTCOME_ERROR(handle(0, 5, ctx), ContextError::CANCELED);

  EXPECT_EQ(stream->chunks.size(), 1);
  EXPECT_TRUE(stream->errors.empty());
  EXPECT_EQ(stream->close_count, 0);
}

/**
 * @given request context already past its deadline
 * @when handling a request
 * @then the handler returns the deadline error before serving anything
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, DeadlineExceeded) {
  auto ctx = RequestContext::background(io_context)->withTimeout(0ms);
  EXPECT_CALL(*source, blobsSidecarsBySlot(_)).Times(0);

  ASSERT_OUTCOME_ERROR(handle(0, 5, ctx), ContextError::DEADLINE_EXCEEDED);

  EXPECT_TRUE(stream->chunks.empty());
}

/**
 * @given cap of one slot, a slot of placeholders only, then a real sidecar
 * @when requesting both slots
 * @then the placeholder slot does not use up the cap and the real sidecar is
 * served
 */
TEST_F(BlobsSidecarsByRangeHandlerTest, PlaceholderSlotIsEmptyForCap) {
  sync_config.max_request_blob_sidecars = 1;
  EXPECT_CALL(*source, blobsSidecarsBySlot(0))
      .WillOnce(Return(BlobsSidecars{sidecar(0, kZeroHash)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(1))
      .WillOnce(Return(BlobsSidecars{sidecar(1, "a"_root)}));
  EXPECT_CALL(*source, blobsSidecarsBySlot(2)).Times(0);

  ASSERT_OUTCOME_SUCCESS(handle(0, 3));

  ASSERT_EQ(stream->chunks.size(), 1);
  EXPECT_EQ(stream->chunks[0].beacon_block_slot, 1);
  EXPECT_EQ(remaining(), 128 - 1);
  EXPECT_EQ(stream->close_count, 1);
}
