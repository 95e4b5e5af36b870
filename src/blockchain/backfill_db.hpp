/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "types/gap_status.hpp"
#include "types/signed_block.hpp"

namespace histsync::blockchain {

  /**
   * Storage operations needed to track and restore the backfill status
   */
  class BackfillDb {
   public:
    virtual ~BackfillDb() = default;

    /**
     * Replaces the persisted gap status as a whole
     */
    virtual outcome::result<void> saveBackfillStatus(
        const GapStatus &status) = 0;

    /**
     * @returns persisted gap status, or
     * BlockStorageError::GAP_STATUS_NOT_FOUND if none was saved yet
     */
    [[nodiscard]] virtual outcome::result<GapStatus> backfillStatus() const = 0;

    /**
     * @returns root of the block the node was checkpoint-synced from, or
     * BlockStorageError::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND if the node was
     * synced from genesis
     */
    [[nodiscard]] virtual outcome::result<BlockHash>
    originCheckpointBlockRoot() const = 0;

    /**
     * @returns block by root, std::nullopt if there is no such block
     */
    [[nodiscard]] virtual outcome::result<std::optional<SignedBeaconBlock>>
    getBlock(const BlockHash &block_root) const = 0;

    /**
     * @returns root of genesis block, or
     * BlockStorageError::GENESIS_BLOCK_ROOT_NOT_FOUND
     */
    [[nodiscard]] virtual outcome::result<BlockHash> genesisBlockRoot()
        const = 0;
  };

}  // namespace histsync::blockchain
