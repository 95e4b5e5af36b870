/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <csignal>

#include <unistd.h>

#include <boost/asio/signal_set.hpp>
#include <libp2p/host/basic_host.hpp>
#include <libp2p/injector/host_injector.hpp>
#include <libp2p/log/configurator.hpp>
#include <libp2p/multi/multiaddress.hpp>
#include <qtils/to_shared_ptr.hpp>

#include "app/configuration.hpp"
#include "blockchain/backfill_status.hpp"
#include "networking/blobs_sidecars_by_range_protocol.hpp"
#include "networking/node_key.hpp"

namespace histsync::app {

  ApplicationImpl::ApplicationImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<blockchain::BackfillStatus> backfill_status,
      qtils::SharedRef<networking::RateLimiterImpl> rate_limiter,
      qtils::SharedRef<networking::BlobsSidecarsByRangeHandler> handler)
      : logsys_(logsys),
        logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        backfill_status_(std::move(backfill_status)),
        rate_limiter_(std::move(rate_limiter)),
        handler_(std::move(handler)) {}

  outcome::result<void> ApplicationImpl::run() {
    logger_->info("Start as node version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());

    if (auto res = backfill_status_->reload(); res.has_error()) {
      SL_CRITICAL(logger_, "Failed to load backfill status: {}", res.error());
      return res.as_failure();
    }
    if (backfill_status_->isGenesisSync()) {
      SL_INFO(logger_, "Node is synced from genesis");
    } else {
      SL_INFO(logger_, "Backfill status: {}", backfill_status_->status());
    }

    auto keypair_res = networking::nodeKeyPair(app_config_->nodeKeyHex());
    if (keypair_res.has_error()) {
      SL_CRITICAL(logger_, "Bad node key: {}", keypair_res.error());
      return keypair_res.as_failure();
    }

    libp2p::log::setLoggingSystem(logsys_->getSoralog());
    auto injector = qtils::toSharedPtr(libp2p::injector::makeHostInjector(
        libp2p::injector::useKeyPair(keypair_res.value())));
    auto io_context =
        injector->create<std::shared_ptr<boost::asio::io_context>>();
    auto host = injector->create<std::shared_ptr<libp2p::host::BasicHost>>();
    SL_INFO(logger_, "PeerId={}", host->getId().toBase58());

    auto protocol =
        std::make_shared<networking::BlobsSidecarsByRangeProtocol>(logsys_,
                                                                   io_context,
                                                                   host,
                                                                   app_config_,
                                                                   rate_limiter_,
                                                                   handler_);
    protocol->start();

    const auto &listen = app_config_->listenMultiaddr();
    auto listen_addr_res = libp2p::multi::Multiaddress::create(listen);
    if (listen_addr_res.has_error()) {
      SL_CRITICAL(logger_,
                  "Bad listen address {}: {}",
                  listen,
                  listen_addr_res.error());
      return listen_addr_res.as_failure();
    }
    if (auto r = host->listen(listen_addr_res.value()); r.has_error()) {
      SL_CRITICAL(logger_, "Error listening on {}: {}", listen, r.error());
      return r.as_failure();
    }
    SL_INFO(logger_, "Listening on {}", listen);
    host->start();

    boost::asio::signal_set signals{*io_context, SIGINT, SIGTERM};
    signals.async_wait(
        [&](const boost::system::error_code &ec, int signal) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Shutdown signal {} received", signal);
          io_context->stop();
        });

    io_context->run();

    host->stop();
    return outcome::success();
  }

}  // namespace histsync::app
