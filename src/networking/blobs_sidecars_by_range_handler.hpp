/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <libp2p/coro/coro.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/blobs_sidecars_by_range_request.hpp"

namespace histsync::app {
  class Configuration;
}

namespace histsync::blockchain {
  class BlobSidecarSource;
}

namespace histsync::networking {

  class RateLimiter;
  class RequestContext;
  class RpcStream;

  /**
   * Serves one blobs sidecars by range request.
   *
   * Sidecars of slots [start_slot, start_slot + count) are written in slot
   * order, one chunk per sidecar, until the range ends or
   * max_request_blob_sidecars non-empty slots were served. Sidecars with
   * zero block root are not served. Between slots the peer is throttled by
   * its rate limiter budget.
   *
   * Fatal conditions end the request with an error and leave the stream to
   * the caller: storage or write failures after a server error response,
   * rate limiting after the limiter's rejection response, and context
   * cancellation or timeout without any response.
   */
  class BlobsSidecarsByRangeHandler {
   public:
    BlobsSidecarsByRangeHandler(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<app::Configuration> app_config,
        qtils::SharedRef<blockchain::BlobSidecarSource> blob_source,
        qtils::SharedRef<RateLimiter> rate_limiter);

    libp2p::CoroOutcome<void> handle(std::shared_ptr<RequestContext> ctx,
                                     BlobsSidecarsByRangeRequest request,
                                     std::shared_ptr<RpcStream> stream);

   private:
    libp2p::Coro<void> writeServerError(std::shared_ptr<RpcStream> stream);

    log::Logger logger_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<blockchain::BlobSidecarSource> blob_source_;
    qtils::SharedRef<RateLimiter> rate_limiter_;
  };

}  // namespace histsync::networking
