/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/blobs_sidecars_by_range_handler.hpp"

#include "app/configuration.hpp"
#include "blockchain/blob_sidecar_source.hpp"
#include "networking/rate_limiter.hpp"
#include "networking/request_context.hpp"
#include "networking/rpc_error.hpp"
#include "networking/rpc_stream.hpp"

namespace histsync::networking {

  BlobsSidecarsByRangeHandler::BlobsSidecarsByRangeHandler(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<blockchain::BlobSidecarSource> blob_source,
      qtils::SharedRef<RateLimiter> rate_limiter)
      : logger_{logsys->getLogger("BlobsSidecarsByRange", "rpc")},
        app_config_{std::move(app_config)},
        blob_source_{std::move(blob_source)},
        rate_limiter_{std::move(rate_limiter)} {}

  libp2p::CoroOutcome<void> BlobsSidecarsByRangeHandler::handle(
      std::shared_ptr<RequestContext> parent_ctx,
      BlobsSidecarsByRangeRequest request,
      std::shared_ptr<RpcStream> stream) {
    const auto &config = app_config_->sync();

    auto ctx = parent_ctx->withTimeout(config.resp_timeout);
    stream->setReadDeadline(config.ttfb_timeout);
    stream->setWriteDeadline(config.resp_timeout);

    const auto peer = stream->remotePeerKey();
    const auto start_slot = request.start_slot;
    const auto end_slot = addSlots(start_slot, request.count);

    const auto allowed_per_second = config.block_batch_limit;
    const auto allowed_burst = static_cast<int64_t>(
        config.block_batch_limit * config.block_batch_limit_burst_factor);
    const auto max_slots = config.max_request_blob_sidecars;

    SL_DEBUG(logger_,
             "Peer {} requested blobs sidecars of slots [{}, {})",
             peer,
             start_slot,
             end_slot);

    uint64_t served_slots = 0;
    uint64_t served_sidecars = 0;
    for (auto slot = start_slot; slot < end_slot and served_slots < max_slots;
         ++slot) {
      BOOST_OUTCOME_CO_TRY(ctx->err());

      BOOST_OUTCOME_CO_TRY(
          co_await rate_limiter_->checkBudget(stream, allowed_per_second));

      auto sidecars_res = blob_source_->blobsSidecarsBySlot(slot);
      if (sidecars_res.has_error()) {
        SL_WARN(logger_,
                "Failed to get blobs sidecars of slot {} for peer {}: {}",
                slot,
                peer,
                sidecars_res.error());
        co_await writeServerError(stream);
        co_return sidecars_res.as_failure();
      }
      const auto &sidecars = sidecars_res.value();
      if (sidecars.empty()) {
        continue;
      }

      uint64_t responded = 0;
      for (const auto &sidecar : sidecars) {
        if (sidecar.beacon_block_root == kZeroHash) {
          continue;
        }
        stream->setWriteDeadline(config.write_timeout);
        auto written = co_await stream->writeChunk(sidecar);
        if (written.has_error()) {
          SL_DEBUG(logger_,
                   "Could not send a chunked response of slot {} to peer {}: "
                   "{}",
                   slot,
                   peer,
                   written.error());
          co_await writeServerError(stream);
          co_return written.as_failure();
        }
        ++responded;
      }
      // Placeholders only: slot is empty for capping and costs nothing
      if (responded == 0) {
        continue;
      }
      ++served_slots;
      served_sidecars += responded;
      rate_limiter_->debit(*stream, responded);

      // Nothing left to send, so no reason to wait for tokens
      if (addSlots(slot, 1) >= end_slot) {
        break;
      }

      BOOST_OUTCOME_CO_TRY(auto quota,
                           rate_limiter_->quotaFor(peer, stream->protocol()));
      if (quota->remaining(peer) < allowed_burst) {
        auto wait = quota->timeUntilRefill(peer);
        SL_TRACE(logger_, "Throttling peer {} for {}ms", peer, wait.count());
        BOOST_OUTCOME_CO_TRY(co_await ctx->sleep(wait));
      }
    }

    SL_DEBUG(logger_,
             "Served {} blobs sidecars ({} slots) to peer {}",
             served_sidecars,
             served_slots,
             peer);
    stream->close();
    co_return outcome::success();
  }

  libp2p::Coro<void> BlobsSidecarsByRangeHandler::writeServerError(
      std::shared_ptr<RpcStream> stream) {
    auto res = co_await stream->writeErrorResponse(
        ResponseCode::SERVER_ERROR,
        make_error_code(RpcError::GENERIC).message());
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Failed to write error response to peer {}: {}",
               stream->remotePeerKey(),
               res.error());
    }
  }

}  // namespace histsync::networking
