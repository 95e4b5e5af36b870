/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/blobs_sidecar.hpp"

namespace histsync::networking {

  /**
   * Approximate serving cost of a sidecar in bytes: the block root and slot
   * plus the size of all blobs.
   */
  inline uint64_t estimateBlobsSidecarCost(const BlobsSidecar &sidecar) {
    constexpr uint64_t kOverheadCost = sizeof(BlockHash) + sizeof(Slot);
    uint64_t cost = kOverheadCost;
    for (const auto &blob : sidecar.blobs) {
      cost += blob.size();
    }
    return cost;
  }

}  // namespace histsync::networking
