/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/block_storage_impl.hpp"

#include <algorithm>

#include "blockchain/block_storage_error.hpp"
#include "blockchain/impl/storage_util.hpp"
#include "storage/predefined_keys.hpp"

namespace histsync::blockchain {

  BlockStorageImpl::BlockStorageImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_(logsys->getLogger("BlockStorage", "block_storage")),
        storage_(std::move(storage)) {}

  outcome::result<void> BlockStorageImpl::saveBackfillStatus(
      const GapStatus &status) {
    OUTCOME_TRY(putToSpace(*storage_,
                           storage::Space::Default,
                           storage::kBackfillStatusLookupKey,
                           encode(status)));
    SL_DEBUG(logger_, "Backfill status saved: {}", status);
    return outcome::success();
  }

  outcome::result<GapStatus> BlockStorageImpl::backfillStatus() const {
    OUTCOME_TRY(status_opt,
                getDecodedFromSpace<GapStatus>(
                    *storage_,
                    storage::Space::Default,
                    storage::kBackfillStatusLookupKey));
    if (not status_opt.has_value()) {
      return BlockStorageError::GAP_STATUS_NOT_FOUND;
    }
    return status_opt.value();
  }

  outcome::result<std::optional<BlockHash>> BlockStorageImpl::getRoot(
      const qtils::ByteVec &lookup_key) const {
    return getDecodedFromSpace<BlockHash>(
        *storage_, storage::Space::Default, lookup_key);
  }

  outcome::result<BlockHash> BlockStorageImpl::originCheckpointBlockRoot()
      const {
    OUTCOME_TRY(root_opt,
                getRoot(storage::kOriginCheckpointBlockRootLookupKey));
    if (not root_opt.has_value()) {
      return BlockStorageError::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND;
    }
    return root_opt.value();
  }

  outcome::result<void> BlockStorageImpl::saveOriginCheckpointBlockRoot(
      const BlockHash &block_root) {
    SL_DEBUG(logger_, "Save origin checkpoint block root {}", block_root);
    return putToSpace(*storage_,
                      storage::Space::Default,
                      storage::kOriginCheckpointBlockRootLookupKey,
                      encode(block_root));
  }

  outcome::result<BlockHash> BlockStorageImpl::genesisBlockRoot() const {
    OUTCOME_TRY(root_opt, getRoot(storage::kGenesisBlockRootLookupKey));
    if (not root_opt.has_value()) {
      return BlockStorageError::GENESIS_BLOCK_ROOT_NOT_FOUND;
    }
    return root_opt.value();
  }

  outcome::result<void> BlockStorageImpl::saveGenesisBlockRoot(
      const BlockHash &block_root) {
    SL_DEBUG(logger_, "Save genesis block root {}", block_root);
    return putToSpace(*storage_,
                      storage::Space::Default,
                      storage::kGenesisBlockRootLookupKey,
                      encode(block_root));
  }

  outcome::result<BlockHash> BlockStorageImpl::putBlock(
      const SignedBeaconBlock &block) {
    auto block_root = sszHash(block.message);
    OUTCOME_TRY(putToSpace(
        *storage_, storage::Space::Block, block_root, encode(block)));
    SL_DEBUG(logger_,
             "Added block {} to storage",
             BlockIndexRef{block.message.slot, block_root});
    return block_root;
  }

  outcome::result<std::optional<SignedBeaconBlock>> BlockStorageImpl::getBlock(
      const BlockHash &block_root) const {
    return getDecodedFromSpace<SignedBeaconBlock>(
        *storage_, storage::Space::Block, block_root);
  }

  outcome::result<void> BlockStorageImpl::putBlobsSidecar(
      const BlobsSidecar &sidecar) {
    std::lock_guard lock{blobs_mutex_};
    const auto key = slotToLookupKey(sidecar.beacon_block_slot);

    OUTCOME_TRY(stored_opt,
                getDecodedFromSpace<SlotBlobsSidecars>(
                    *storage_, storage::Space::BlobSidecars, key));
    auto stored = std::move(stored_opt).value_or(SlotBlobsSidecars{});

    auto it = std::ranges::find_if(stored.sidecars, [&](const auto &present) {
      return present.beacon_block_root == sidecar.beacon_block_root;
    });
    if (it != stored.sidecars.end()) {
      *it = sidecar;
    } else {
      if (stored.sidecars.size() >= kMaxBlobsSidecarsPerSlot) {
        SL_WARN(logger_,
                "Can't add blobs sidecar of block {}: slot already has {}",
                BlockIndexRef{sidecar.beacon_block_slot,
                              sidecar.beacon_block_root},
                stored.sidecars.size());
        return BlockStorageError::TOO_MANY_SIDECARS;
      }
      stored.sidecars.push_back(sidecar);
    }

    OUTCOME_TRY(putToSpace(
        *storage_, storage::Space::BlobSidecars, key, encode(stored)));
    SL_TRACE(logger_,
             "Blobs sidecar of block {} saved ({} blobs)",
             BlockIndexRef{sidecar.beacon_block_slot, sidecar.beacon_block_root},
             sidecar.blobs.size());
    return outcome::success();
  }

  outcome::result<BlobsSidecars> BlockStorageImpl::blobsSidecarsBySlot(
      Slot slot) const {
    OUTCOME_TRY(stored_opt,
                getDecodedFromSpace<SlotBlobsSidecars>(
                    *storage_,
                    storage::Space::BlobSidecars,
                    slotToLookupKey(slot)));
    if (not stored_opt.has_value()) {
      return BlobsSidecars{};
    }
    auto &sidecars = stored_opt.value().sidecars;
    return BlobsSidecars(sidecars.begin(), sidecars.end());
  }

}  // namespace histsync::blockchain
