/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/gap_status.hpp"

namespace histsync::blockchain {

  /**
   * Tracks the part of history missing after checkpoint sync.
   *
   * Slots at or below the low boundary and at or above the high boundary are
   * covered by local history; slots strictly between them are not. The
   * boundaries only move toward each other. Every change is persisted before
   * it becomes visible through status().
   */
  class BackfillStatus {
   public:
    virtual ~BackfillStatus() = default;

    /**
     * Loads the status from storage. Without a stored status, builds one
     * from the origin checkpoint block, or marks the node as synced from
     * genesis if there is no origin checkpoint.
     */
    virtual outcome::result<void> reload() = 0;

    /**
     * @returns true if the slot is present in local history
     */
    [[nodiscard]] virtual bool slotCovered(Slot slot) const = 0;

    /**
     * Moves the low boundary up to {@param new_low}.
     * Fails with BackfillStatusError::FILL_FWD_PAST_UPPER if it is above the
     * high boundary.
     */
    virtual outcome::result<void> fillFwd(Slot new_low,
                                          const BlockHash &root) = 0;

    /**
     * Moves the high boundary down to {@param new_high}.
     * Fails with BackfillStatusError::FILL_BACK_PAST_LOWER if it is below the
     * low boundary.
     */
    virtual outcome::result<void> fillBack(Slot new_high,
                                           const BlockHash &root) = 0;

    [[nodiscard]] virtual GapStatus status() const = 0;

    /// true if the node has full history from genesis
    [[nodiscard]] virtual bool isGenesisSync() const = 0;
  };

}  // namespace histsync::blockchain
