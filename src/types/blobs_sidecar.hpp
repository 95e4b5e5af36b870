/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/constants.hpp"
#include "types/types.hpp"

namespace histsync {

  using Blob = ssz::list<uint8_t, BYTES_PER_BLOB>;

  /**
   * @struct BlobsSidecar
   * Blobs accompanying a block. One sidecar is one unit of a range response.
   */
  struct BlobsSidecar : ssz::ssz_variable_size_container {
    BlockHash beacon_block_root;
    Slot beacon_block_slot = 0;
    ssz::list<Blob, MAX_BLOBS_PER_BLOCK> blobs;
    KzgProof kzg_aggregated_proof;

    SSZ_CONT(beacon_block_root,
             beacon_block_slot,
             blobs,
             kzg_aggregated_proof);
  };

  using BlobsSidecars = std::vector<BlobsSidecar>;

}  // namespace histsync
