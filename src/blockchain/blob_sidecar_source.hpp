/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/blobs_sidecar.hpp"

namespace histsync::blockchain {

  /**
   * Read access to stored blobs sidecars, used to serve range requests
   */
  class BlobSidecarSource {
   public:
    virtual ~BlobSidecarSource() = default;

    /**
     * @returns all sidecars stored for the slot in insertion order; empty if
     * there are none
     */
    [[nodiscard]] virtual outcome::result<BlobsSidecars> blobsSidecarsBySlot(
        Slot slot) const = 0;
  };

}  // namespace histsync::blockchain
