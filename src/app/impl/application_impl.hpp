/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"
#include "log/logger.hpp"

namespace histsync::app {
  class Configuration;
}  // namespace histsync::app

namespace histsync::blockchain {
  class BackfillStatus;
}  // namespace histsync::blockchain

namespace histsync::networking {
  class BlobsSidecarsByRangeHandler;
  class RateLimiterImpl;
}  // namespace histsync::networking

namespace histsync::app {

  /**
   * Loads the backfill status, then serves blobs sidecars by range to peers
   * over libp2p until SIGINT or SIGTERM.
   */
  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<Configuration> config,
        qtils::SharedRef<blockchain::BackfillStatus> backfill_status,
        qtils::SharedRef<networking::RateLimiterImpl> rate_limiter,
        qtils::SharedRef<networking::BlobsSidecarsByRangeHandler> handler);

    outcome::result<void> run() override;

   private:
    qtils::SharedRef<log::LoggingSystem> logsys_;
    log::Logger logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<blockchain::BackfillStatus> backfill_status_;
    qtils::SharedRef<networking::RateLimiterImpl> rate_limiter_;
    qtils::SharedRef<networking::BlobsSidecarsByRangeHandler> handler_;
  };

}  // namespace histsync::app
