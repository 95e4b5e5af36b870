/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include <qtils/test/outcome.hpp>

#include "blockchain/backfill_status_error.hpp"
#include "blockchain/block_storage_error.hpp"
#include "blockchain/impl/backfill_status_impl.hpp"
#include "mock/blockchain/backfill_db_mock.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

using histsync::BlockHash;
using histsync::GapStatus;
using histsync::SignedBeaconBlock;
using histsync::Slot;
using histsync::blockchain::BackfillDbMock;
using histsync::blockchain::BackfillStatusError;
using histsync::blockchain::BackfillStatusImpl;
using histsync::blockchain::BlockStorageError;
using histsync::blockchain::BackfillDb;
using testing::_;
using testing::Return;

class BackfillStatusTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    db = std::make_shared<BackfillDbMock>();
    backfill_status = std::make_unique<BackfillStatusImpl>(logsys, db);
  }

  void TearDown() override {
    backfill_status.reset();
  }

  static SignedBeaconBlock blockAt(Slot slot) {
    SignedBeaconBlock block;
    block.message.slot = slot;
    return block;
  }

  /// Stored status reloads without any write
  void loadStored(const GapStatus &status) {
    EXPECT_CALL(*db, backfillStatus()).WillOnce(Return(status));
    EXPECT_CALL(*db, saveBackfillStatus(status))
        .WillOnce(Return(outcome::success()));
    ASSERT_OUTCOME_SUCCESS(backfill_status->reload());
    testing::Mock::VerifyAndClearExpectations(db.get());
  }

  qtils::SharedRef<histsync::log::LoggingSystem> logsys =
      testutil::prepareLoggers();

  std::shared_ptr<BackfillDbMock> db;
  std::unique_ptr<BackfillStatusImpl> backfill_status;

  BlockHash genesis_root{"genesis"_root};
  BlockHash origin_root{"origin"_root};

  GapStatus gap{
      .low_slot = 10,
      .low_root = "low"_root,
      .high_slot = 100,
      .high_root = "high"_root,
      .origin_slot = 100,
      .origin_root = "origin"_root,
  };
};

/**
 * @given a node checkpoint-synced from origin block at slot 100, without
 * persisted backfill status
 * @when reloading the tracker and then advancing both boundaries
 * @then status is synthesized from genesis and origin, every accepted change
 * is persisted as a full record, and coverage follows the boundaries
 */
TEST_F(BackfillStatusTest, LegacyRecoveryThenFill) {
  GapStatus recovered{
      .low_slot = 0,
      .low_root = genesis_root,
      .high_slot = 100,
      .high_root = origin_root,
      .origin_slot = 100,
      .origin_root = origin_root,
  };

  EXPECT_CALL(*db, backfillStatus())
      .WillOnce(Return(BlockStorageError::GAP_STATUS_NOT_FOUND));
  EXPECT_CALL(*db, originCheckpointBlockRoot()).WillOnce(Return(origin_root));
  EXPECT_CALL(*db, getBlock(origin_root))
      .WillOnce(Return(std::make_optional(blockAt(100))));
  EXPECT_CALL(*db, genesisBlockRoot()).WillOnce(Return(genesis_root));
  EXPECT_CALL(*db, saveBackfillStatus(recovered))
      .WillOnce(Return(outcome::success()));

  ASSERT_OUTCOME_SUCCESS(backfill_status->reload());
  EXPECT_FALSE(backfill_status->isGenesisSync());
  EXPECT_EQ(backfill_status->status(), recovered);

  EXPECT_TRUE(backfill_status->slotCovered(0));
  EXPECT_FALSE(backfill_status->slotCovered(1));
  EXPECT_FALSE(backfill_status->slotCovered(99));
  EXPECT_TRUE(backfill_status->slotCovered(100));
  EXPECT_TRUE(backfill_status->slotCovered(101));

  // fill forward from genesis side
  auto after_fwd = recovered;
  after_fwd.low_slot = 50;
  after_fwd.low_root = "x"_root;
  EXPECT_CALL(*db, saveBackfillStatus(after_fwd))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(backfill_status->fillFwd(50, "x"_root));
  EXPECT_TRUE(backfill_status->slotCovered(50));
  EXPECT_FALSE(backfill_status->slotCovered(51));

  // fill back from origin side
  auto after_back = after_fwd;
  after_back.high_slot = 60;
  after_back.high_root = "y"_root;
  EXPECT_CALL(*db, saveBackfillStatus(after_back))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(backfill_status->fillBack(60, "y"_root));
  EXPECT_TRUE(backfill_status->slotCovered(60));
  EXPECT_FALSE(backfill_status->slotCovered(55));

  // crossing the opposite boundary is rejected without writing
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);
  ASSERT_OUTCOME_ERROR(backfill_status->fillFwd(61, "z"_root),
                       BackfillStatusError::FILL_FWD_PAST_UPPER);
  ASSERT_OUTCOME_ERROR(backfill_status->fillBack(49, "z"_root),
                       BackfillStatusError::FILL_BACK_PAST_LOWER);
  EXPECT_EQ(backfill_status->status(), after_back);
}

/**
 * @given no persisted status and no origin checkpoint root
 * @when reloading
 * @then node is treated as synced from genesis and every slot is covered
 */
TEST_F(BackfillStatusTest, GenesisSync) {
  EXPECT_CALL(*db, backfillStatus())
      .WillOnce(Return(BlockStorageError::GAP_STATUS_NOT_FOUND));
  EXPECT_CALL(*db, originCheckpointBlockRoot())
      .WillOnce(Return(BlockStorageError::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND));
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);

  ASSERT_OUTCOME_SUCCESS(backfill_status->reload());
  EXPECT_TRUE(backfill_status->isGenesisSync());
  for (Slot slot : {Slot{0}, Slot{1}, Slot{1'000'000}, UINT64_MAX}) {
    EXPECT_TRUE(backfill_status->slotCovered(slot)) << slot;
  }
}

/**
 * @given persisted status
 * @when reloading
 * @then persisted status becomes current
 */
TEST_F(BackfillStatusTest, ReloadStored) {
  loadStored(gap);
  EXPECT_EQ(backfill_status->status(), gap);
  EXPECT_FALSE(backfill_status->isGenesisSync());
}

/**
 * @given loaded status
 * @when reloading again with the same persisted record
 * @then nothing is written
 */
TEST_F(BackfillStatusTest, ReloadSameIsNoop) {
  loadStored(gap);

  EXPECT_CALL(*db, backfillStatus()).WillOnce(Return(gap));
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS(backfill_status->reload());
  EXPECT_EQ(backfill_status->status(), gap);
}

/**
 * @given storage failing with an error other than not-found
 * @when reloading
 * @then the error is returned and nothing is recovered
 */
TEST_F(BackfillStatusTest, ReloadStorageFailure) {
  EXPECT_CALL(*db, backfillStatus())
      .WillOnce(Return(testutil::DummyError::ERROR));
  EXPECT_CALL(*db, originCheckpointBlockRoot()).Times(0);
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);

  ASSERT_OUTCOME_ERROR(backfill_status->reload(), testutil::DummyError::ERROR);
}

/**
 * @given origin checkpoint root whose block is absent
 * @when reloading
 * @then reload fails with nil origin block
 */
TEST_F(BackfillStatusTest, NilOriginBlock) {
  EXPECT_CALL(*db, backfillStatus())
      .WillOnce(Return(BlockStorageError::GAP_STATUS_NOT_FOUND));
  EXPECT_CALL(*db, originCheckpointBlockRoot()).WillOnce(Return(origin_root));
  EXPECT_CALL(*db, getBlock(origin_root))
      .WillOnce(Return(std::optional<SignedBeaconBlock>{}));
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);

  ASSERT_OUTCOME_ERROR(backfill_status->reload(),
                       BackfillStatusError::NIL_ORIGIN_BLOCK);
}

/**
 * @given origin checkpoint block but no genesis root
 * @when reloading
 * @then reload fails, since the low boundary can not be built
 */
TEST_F(BackfillStatusTest, GenesisRootRequired) {
  EXPECT_CALL(*db, backfillStatus())
      .WillOnce(Return(BlockStorageError::GAP_STATUS_NOT_FOUND));
  EXPECT_CALL(*db, originCheckpointBlockRoot()).WillOnce(Return(origin_root));
  EXPECT_CALL(*db, getBlock(origin_root))
      .WillOnce(Return(std::make_optional(blockAt(100))));
  EXPECT_CALL(*db, genesisBlockRoot())
      .WillOnce(Return(BlockStorageError::GENESIS_BLOCK_ROOT_NOT_FOUND));
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);

  ASSERT_OUTCOME_ERROR(backfill_status->reload(),
                       BackfillStatusError::GENESIS_ROOT_REQUIRED);
}

/**
 * @given loaded status
 * @when advancing a boundary to its current value and root
 * @then nothing is written
 */
TEST_F(BackfillStatusTest, SameBoundaryIsNoop) {
  loadStored(gap);

  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS(backfill_status->fillFwd(gap.low_slot, gap.low_root));
  ASSERT_OUTCOME_SUCCESS(
      backfill_status->fillBack(gap.high_slot, gap.high_root));
  EXPECT_EQ(backfill_status->status(), gap);
}

/**
 * @given loaded status and storage failing to save
 * @when advancing a boundary
 * @then the error is returned and the cached status is unchanged
 */
TEST_F(BackfillStatusTest, SaveFailureKeepsCache) {
  loadStored(gap);

  EXPECT_CALL(*db, saveBackfillStatus(_))
      .WillOnce(Return(testutil::DummyError::ERROR));
  ASSERT_OUTCOME_ERROR(backfill_status->fillFwd(20, "x"_root),
                       testutil::DummyError::ERROR);
  EXPECT_EQ(backfill_status->status(), gap);
  EXPECT_FALSE(backfill_status->slotCovered(20));
}

/**
 * @given loaded status
 * @when moving low boundary exactly onto high boundary and back down
 * @then meeting is allowed, and the new record replaces the old one as a
 * whole even if it moves the boundary backward
 */
TEST_F(BackfillStatusTest, BoundariesMayMeet) {
  loadStored(gap);

  auto met = gap;
  met.low_slot = gap.high_slot;
  met.low_root = "met"_root;
  EXPECT_CALL(*db, saveBackfillStatus(met))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(backfill_status->fillFwd(gap.high_slot, "met"_root));
  for (Slot slot = 0; slot <= 200; ++slot) {
    EXPECT_TRUE(backfill_status->slotCovered(slot)) << slot;
  }

  auto back = met;
  back.low_slot = 50;
  back.low_root = "back"_root;
  EXPECT_CALL(*db, saveBackfillStatus(back))
      .WillOnce(Return(outcome::success()));
  ASSERT_OUTCOME_SUCCESS(backfill_status->fillFwd(50, "back"_root));
  EXPECT_EQ(backfill_status->status(), back);
  EXPECT_TRUE(backfill_status->slotCovered(50));
  EXPECT_FALSE(backfill_status->slotCovered(51));
}

/**
 * @given tracker which was never reloaded
 * @when advancing a boundary or asking for coverage
 * @then advance is refused without touching storage and no slot is covered
 */
TEST_F(BackfillStatusTest, FillBeforeReload) {
  EXPECT_FALSE(backfill_status->slotCovered(0));
  EXPECT_FALSE(backfill_status->slotCovered(1000));
  EXPECT_CALL(*db, saveBackfillStatus(_)).Times(0);
  ASSERT_OUTCOME_ERROR(backfill_status->fillFwd(1, "x"_root),
                       BackfillStatusError::NOT_INITIALIZED);
  ASSERT_OUTCOME_ERROR(backfill_status->fillBack(1, "x"_root),
                       BackfillStatusError::NOT_INITIALIZED);
}

/**
 * @given a tracker instance
 * @when creating another one in the same process
 * @then creation fails
 */
TEST_F(BackfillStatusTest, SingleInstance) {
  EXPECT_THROW(BackfillStatusImpl(logsys, db), std::logic_error);
}

/// BackfillDb keeping every saved record, safe to use from many threads
class RecordingBackfillDb : public BackfillDb {
 public:
  explicit RecordingBackfillDb(GapStatus initial) : saved_{initial} {}

  outcome::result<void> saveBackfillStatus(const GapStatus &status) override {
    std::lock_guard lock{mutex_};
    saved_.push_back(status);
    return outcome::success();
  }

  outcome::result<GapStatus> backfillStatus() const override {
    std::lock_guard lock{mutex_};
    return saved_.back();
  }

  outcome::result<BlockHash> originCheckpointBlockRoot() const override {
    return BlockStorageError::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND;
  }

  outcome::result<std::optional<SignedBeaconBlock>> getBlock(
      const BlockHash &) const override {
    return std::nullopt;
  }

  outcome::result<BlockHash> genesisBlockRoot() const override {
    return BlockStorageError::GENESIS_BLOCK_ROOT_NOT_FOUND;
  }

  std::vector<GapStatus> saved() const {
    std::lock_guard lock{mutex_};
    return saved_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<GapStatus> saved_;
};

/**
 * @given tracker loaded with gap (0, 4000)
 * @when two threads raise the low boundary and two threads lower the high
 * boundary towards each other, while other threads read the status
 * @then low boundary never passes high boundary in any saved or observed
 * record, crossing advances are refused, and the last saved record is the
 * cached one
 */
TEST(BackfillStatusConcurrencyTest, BoundariesRaceTowardsEachOther) {
  testutil::prepareLoggers();
  constexpr Slot kHigh = 4000;
  auto db = std::make_shared<RecordingBackfillDb>(GapStatus{
      .low_slot = 0,
      .low_root = "genesis"_root,
      .high_slot = kHigh,
      .high_root = "origin"_root,
      .origin_slot = kHigh,
      .origin_root = "origin"_root,
  });
  BackfillStatusImpl backfill_status{testutil::prepareLoggers(), db};
  ASSERT_OUTCOME_SUCCESS(backfill_status.reload());

  std::atomic_bool writing{true};
  std::atomic_size_t unexpected_errors{0};
  std::atomic_size_t observed_violations{0};

  auto advance = [&](Slot offset, bool forward) {
    for (Slot step = 1; step < kHigh / 2; ++step) {
      auto slot = 2 * step + offset;
      auto res = forward ? backfill_status.fillFwd(slot, "low"_root)
                         : backfill_status.fillBack(kHigh - slot, "high"_root);
      if (res.has_error()
          and res.error() != BackfillStatusError::FILL_FWD_PAST_UPPER
          and res.error() != BackfillStatusError::FILL_BACK_PAST_LOWER) {
        ++unexpected_errors;
      }
    }
  };
  auto read = [&] {
    while (writing) {
      auto status = backfill_status.status();
      if (status.low_slot > status.high_slot) {
        ++observed_violations;
      }
      if (not backfill_status.slotCovered(0)
          or not backfill_status.slotCovered(kHigh)) {
        ++observed_violations;
      }
    }
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < 2; ++i) {
    readers.emplace_back(read);
  }
  std::vector<std::thread> writers;
  writers.emplace_back(advance, 0, true);
  writers.emplace_back(advance, 1, true);
  writers.emplace_back(advance, 0, false);
  writers.emplace_back(advance, 1, false);
  for (auto &writer : writers) {
    writer.join();
  }
  writing = false;
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(unexpected_errors.load(), 0);
  EXPECT_EQ(observed_violations.load(), 0);

  auto saved = db->saved();
  ASSERT_GT(saved.size(), 1);
  for (const auto &status : saved) {
    EXPECT_LE(status.low_slot, status.high_slot)
        << fmt::format("{}", status);
  }
  EXPECT_EQ(saved.back(), backfill_status.status());
}
