/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/backfill_status_impl.hpp"

#include <mutex>

#include "blockchain/backfill_status_error.hpp"
#include "blockchain/block_storage_error.hpp"

namespace histsync::blockchain {

  BackfillStatusImpl::BackfillStatusImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<BackfillDb> db)
      : logger_(logsys->getLogger("BackfillStatus", "backfill")),
        db_(std::move(db)) {}

  outcome::result<void> BackfillStatusImpl::reload() {
    std::unique_lock lock{mutex_};

    auto status_res = db_->backfillStatus();
    if (status_res.has_error()) {
      if (status_res.error() == BlockStorageError::GAP_STATUS_NOT_FOUND) {
        return recoverLegacy();
      }
      SL_ERROR(logger_,
               "Failed to load backfill status: {}",
               status_res.error());
      return status_res.as_failure();
    }

    OUTCOME_TRY(updateStatusLocked(status_res.value()));
    loaded_ = true;
    SL_INFO(logger_, "Backfill status loaded: {}", status_);
    return outcome::success();
  }

  outcome::result<void> BackfillStatusImpl::recoverLegacy() {
    auto origin_root_res = db_->originCheckpointBlockRoot();
    if (origin_root_res.has_error()) {
      if (origin_root_res.error()
          == BlockStorageError::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND) {
        genesis_sync_ = true;
        loaded_ = true;
        SL_INFO(logger_, "No origin checkpoint; node is synced from genesis");
        return outcome::success();
      }
      SL_ERROR(logger_,
               "Failed to get origin checkpoint block root: {}",
               origin_root_res.error());
      return origin_root_res.as_failure();
    }
    const auto &origin_root = origin_root_res.value();

    auto block_res = db_->getBlock(origin_root);
    if (block_res.has_error()) {
      SL_ERROR(logger_,
               "Error retrieving block for origin checkpoint root={}: {}",
               origin_root,
               block_res.error());
      return block_res.as_failure();
    }
    if (not block_res.value().has_value()) {
      SL_ERROR(logger_,
               "Nil block found for origin checkpoint root={}",
               origin_root);
      return BackfillStatusError::NIL_ORIGIN_BLOCK;
    }
    const auto origin_slot = block_res.value()->message.slot;

    auto genesis_root_res = db_->genesisBlockRoot();
    if (genesis_root_res.has_error()) {
      if (genesis_root_res.error()
          == BlockStorageError::GENESIS_BLOCK_ROOT_NOT_FOUND) {
        SL_ERROR(logger_,
                 "Genesis block root required for checkpoint sync "
                 "from origin {}",
                 BlockIndexRef{origin_slot, origin_root});
        return BackfillStatusError::GENESIS_ROOT_REQUIRED;
      }
      SL_ERROR(logger_,
               "Failed to get genesis block root: {}",
               genesis_root_res.error());
      return genesis_root_res.as_failure();
    }

    GapStatus status{
        .low_slot = 0,
        .low_root = genesis_root_res.value(),
        .high_slot = origin_slot,
        .high_root = origin_root,
        .origin_slot = origin_slot,
        .origin_root = origin_root,
    };
    OUTCOME_TRY(updateStatusLocked(status));
    loaded_ = true;
    SL_INFO(logger_, "Backfill status recovered from checkpoint: {}", status_);
    return outcome::success();
  }

  bool BackfillStatusImpl::slotCovered(Slot slot) const {
    std::shared_lock lock{mutex_};
    if (not loaded_) {
      return false;
    }
    if (genesis_sync_) {
      return true;
    }
    return not(status_.low_slot < slot and slot < status_.high_slot);
  }

  outcome::result<void> BackfillStatusImpl::fillFwd(Slot new_low,
                                                    const BlockHash &root) {
    std::unique_lock lock{mutex_};
    if (not loaded_) {
      return BackfillStatusError::NOT_INITIALIZED;
    }
    if (new_low > status_.high_slot) {
      SL_WARN(logger_,
              "Can't advance low boundary: advance slot={}, high slot={}",
              new_low,
              status_.high_slot);
      return BackfillStatusError::FILL_FWD_PAST_UPPER;
    }
    auto status = status_;
    status.low_slot = new_low;
    status.low_root = root;
    return updateStatusLocked(status);
  }

  outcome::result<void> BackfillStatusImpl::fillBack(Slot new_high,
                                                     const BlockHash &root) {
    std::unique_lock lock{mutex_};
    if (not loaded_) {
      return BackfillStatusError::NOT_INITIALIZED;
    }
    if (new_high < status_.low_slot) {
      SL_WARN(logger_,
              "Can't advance high boundary: advance slot={}, low slot={}",
              new_high,
              status_.low_slot);
      return BackfillStatusError::FILL_BACK_PAST_LOWER;
    }
    auto status = status_;
    status.high_slot = new_high;
    status.high_root = root;
    return updateStatusLocked(status);
  }

  outcome::result<void> BackfillStatusImpl::updateStatusLocked(
      const GapStatus &status) {
    if (status_ == status) {
      return outcome::success();
    }
    if (auto res = db_->saveBackfillStatus(status); res.has_error()) {
      SL_ERROR(logger_,
               "Failed to save backfill status ({}): {}",
               status,
               res.error());
      return res.as_failure();
    }
    status_ = status;
    SL_DEBUG(logger_, "Backfill status updated: {}", status_);
    return outcome::success();
  }

  GapStatus BackfillStatusImpl::status() const {
    std::shared_lock lock{mutex_};
    return status_;
  }

  bool BackfillStatusImpl::isGenesisSync() const {
    std::shared_lock lock{mutex_};
    return genesis_sync_;
  }

}  // namespace histsync::blockchain
