/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <qtils/shared_ref.hpp>

#include "blockchain/block_storage.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace histsync::blockchain {

  class BlockStorageImpl : public BlockStorage, Singleton<BlockStorage> {
   public:
    BlockStorageImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<storage::SpacedStorage> storage);

    ~BlockStorageImpl() override = default;

    // -- backfill --

    outcome::result<void> saveBackfillStatus(const GapStatus &status) override;

    outcome::result<GapStatus> backfillStatus() const override;

    outcome::result<BlockHash> originCheckpointBlockRoot() const override;

    outcome::result<void> saveOriginCheckpointBlockRoot(
        const BlockHash &block_root) override;

    outcome::result<BlockHash> genesisBlockRoot() const override;

    outcome::result<void> saveGenesisBlockRoot(
        const BlockHash &block_root) override;

    // -- blocks --

    outcome::result<BlockHash> putBlock(
        const SignedBeaconBlock &block) override;

    outcome::result<std::optional<SignedBeaconBlock>> getBlock(
        const BlockHash &block_root) const override;

    // -- blobs --

    outcome::result<void> putBlobsSidecar(const BlobsSidecar &sidecar) override;

    outcome::result<BlobsSidecars> blobsSidecarsBySlot(
        Slot slot) const override;

   private:
    outcome::result<std::optional<BlockHash>> getRoot(
        const qtils::ByteVec &lookup_key) const;

    log::Logger logger_;
    qtils::SharedRef<storage::SpacedStorage> storage_;

    // serializes read-modify-write of per-slot sidecar lists
    std::mutex blobs_mutex_;
  };

}  // namespace histsync::blockchain
