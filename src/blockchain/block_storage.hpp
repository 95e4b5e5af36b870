/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "blockchain/backfill_db.hpp"
#include "blockchain/blob_sidecar_source.hpp"
#include "types/blobs_sidecar.hpp"
#include "types/signed_block.hpp"

namespace histsync::blockchain {

  /**
   * A wrapper for a storage of blocks and blobs
   * Provides a convenient interface to work with it
   */
  class BlockStorage : public BackfillDb, public BlobSidecarSource {
   public:
    ~BlockStorage() override = default;

    // -- blocks --

    /**
     * Saves block to block storage
     * @returns root of saved block or error
     */
    virtual outcome::result<BlockHash> putBlock(
        const SignedBeaconBlock &block) = 0;

    // -- well-known roots --

    virtual outcome::result<void> saveOriginCheckpointBlockRoot(
        const BlockHash &block_root) = 0;

    virtual outcome::result<void> saveGenesisBlockRoot(
        const BlockHash &block_root) = 0;

    // -- blobs --

    /**
     * Adds sidecar to the list of its slot. A sidecar of the same block
     * replaces the stored one in place.
     */
    virtual outcome::result<void> putBlobsSidecar(
        const BlobsSidecar &sidecar) = 0;
  };

}  // namespace histsync::blockchain
