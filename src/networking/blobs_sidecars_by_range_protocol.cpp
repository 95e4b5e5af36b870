/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/blobs_sidecars_by_range_protocol.hpp"

#include <libp2p/coro/spawn.hpp>
#include <libp2p/host/basic_host.hpp>

#include "app/configuration.hpp"
#include "networking/blobs_sidecars_by_range_handler.hpp"
#include "networking/impl/rate_limiter_impl.hpp"
#include "networking/libp2p_rpc_stream.hpp"
#include "networking/request_context.hpp"
#include "networking/rpc_error.hpp"

namespace histsync::networking {

  BlobsSidecarsByRangeProtocol::BlobsSidecarsByRangeProtocol(
      qtils::SharedRef<log::LoggingSystem> logsys,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<libp2p::host::BasicHost> host,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<RateLimiterImpl> rate_limiter,
      qtils::SharedRef<BlobsSidecarsByRangeHandler> handler)
      : logger_{logsys->getLogger("BlobsSidecarsByRangeProtocol", "rpc")},
        io_context_{std::move(io_context)},
        host_{std::move(host)},
        app_config_{std::move(app_config)},
        rate_limiter_{std::move(rate_limiter)},
        handler_{std::move(handler)} {}

  libp2p::StreamProtocols BlobsSidecarsByRangeProtocol::getProtocolIds()
      const {
    return {kProtocolId};
  }

  void BlobsSidecarsByRangeProtocol::handle(
      std::shared_ptr<libp2p::Stream> stream) {
    libp2p::coroSpawn(
        *io_context_,
        [self{shared_from_this()}, stream]() -> libp2p::Coro<void> {
          std::ignore = co_await self->coroRespond(stream);
        });
  }

  void BlobsSidecarsByRangeProtocol::start() {
    rate_limiter_->registerTopic(kProtocolId);
    host_->listenProtocol(shared_from_this());
  }

  libp2p::CoroOutcome<void> BlobsSidecarsByRangeProtocol::coroRespond(
      std::shared_ptr<libp2p::Stream> stream) {
    auto rpc_stream = std::make_shared<Libp2pRpcStream>(io_context_, stream);
    rpc_stream->setReadDeadline(app_config_->sync().ttfb_timeout);

    auto request_res = co_await rpc_stream->readRequest();
    if (request_res.has_error()) {
      SL_DEBUG(logger_,
               "Bad request from peer {}: {}",
               rpc_stream->remotePeerKey(),
               request_res.error());
      auto written = co_await rpc_stream->writeErrorResponse(
          ResponseCode::INVALID_REQUEST,
          make_error_code(RpcError::INVALID_REQUEST).message());
      if (written.has_error()) {
        SL_DEBUG(logger_,
                 "Failed to reject request of peer {}: {}",
                 rpc_stream->remotePeerKey(),
                 written.error());
      }
      rpc_stream->reset();
      co_return request_res.as_failure();
    }

    auto res = co_await handler_->handle(RequestContext::background(io_context_),
                                         request_res.value(),
                                         rpc_stream);
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Request of peer {} failed: {}",
               rpc_stream->remotePeerKey(),
               res.error());
      rpc_stream->reset();
      co_return res.as_failure();
    }
    co_return outcome::success();
  }

}  // namespace histsync::networking
