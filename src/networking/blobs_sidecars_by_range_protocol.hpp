/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <libp2p/protocol/base_protocol.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace libp2p::host {
  class BasicHost;
}  // namespace libp2p::host

namespace histsync::app {
  class Configuration;
}  // namespace histsync::app

namespace histsync::networking {

  class BlobsSidecarsByRangeHandler;
  class RateLimiterImpl;

  /// Server of /eth2/beacon_chain/req/blobs_sidecars_by_range/1/ssz_snappy
  class BlobsSidecarsByRangeProtocol
      : public std::enable_shared_from_this<BlobsSidecarsByRangeProtocol>,
        public libp2p::protocol::BaseProtocol {
   public:
    static constexpr auto kProtocolId =
        "/eth2/beacon_chain/req/blobs_sidecars_by_range/1/ssz_snappy";

    BlobsSidecarsByRangeProtocol(
        qtils::SharedRef<log::LoggingSystem> logsys,
        std::shared_ptr<boost::asio::io_context> io_context,
        std::shared_ptr<libp2p::host::BasicHost> host,
        qtils::SharedRef<app::Configuration> app_config,
        qtils::SharedRef<RateLimiterImpl> rate_limiter,
        qtils::SharedRef<BlobsSidecarsByRangeHandler> handler);

    // BaseProtocol
    libp2p::StreamProtocols getProtocolIds() const override;
    void handle(std::shared_ptr<libp2p::Stream> stream) override;

    void start();

   private:
    libp2p::CoroOutcome<void> coroRespond(
        std::shared_ptr<libp2p::Stream> stream);

    log::Logger logger_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<libp2p::host::BasicHost> host_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<RateLimiterImpl> rate_limiter_;
    qtils::SharedRef<BlobsSidecarsByRangeHandler> handler_;
  };

}  // namespace histsync::networking
