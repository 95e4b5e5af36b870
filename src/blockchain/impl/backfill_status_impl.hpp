/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>

#include <qtils/shared_ref.hpp>

#include "blockchain/backfill_db.hpp"
#include "blockchain/backfill_status.hpp"
#include "log/logger.hpp"
#include "utils/ctor_limiters.hpp"

namespace histsync::blockchain {

  /**
   * Only one instance may exist in the process, since a second one over the
   * same storage would let persisted state and cached state diverge.
   */
  class BackfillStatusImpl : public BackfillStatus,
                             Singleton<BackfillStatusImpl> {
   public:
    BackfillStatusImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                       qtils::SharedRef<BackfillDb> db);

    outcome::result<void> reload() override;

    bool slotCovered(Slot slot) const override;

    outcome::result<void> fillFwd(Slot new_low, const BlockHash &root) override;

    outcome::result<void> fillBack(Slot new_high,
                                   const BlockHash &root) override;

    GapStatus status() const override;

    bool isGenesisSync() const override;

   private:
    /// Builds the status of a node checkpoint-synced before it was tracked
    outcome::result<void> recoverLegacy();

    /// Persists the status, then caches it. Requires exclusive lock.
    outcome::result<void> updateStatusLocked(const GapStatus &status);

    log::Logger logger_;
    qtils::SharedRef<BackfillDb> db_;

    mutable std::shared_mutex mutex_;
    bool loaded_ = false;
    bool genesis_sync_ = false;
    GapStatus status_;
  };

}  // namespace histsync::blockchain
