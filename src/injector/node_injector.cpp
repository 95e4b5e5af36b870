/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "blockchain/impl/backfill_status_impl.hpp"
#include "blockchain/impl/block_storage_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "log/logger.hpp"
#include "networking/blobs_sidecars_by_range_handler.hpp"
#include "networking/impl/rate_limiter_impl.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace {
  namespace di = boost::di;
  using namespace histsync;  // NOLINT

  /// Binds interface to the single shared instance of implementation
  template <typename Impl>
  auto sharedImpl() {
    return [](const auto &injector) {
      return injector.template create<std::shared_ptr<Impl>>();
    };
  }

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SteadyClock>.to<clock::SteadyClockImpl>(),
        di::bind<storage::SpacedStorage>.to<storage::RocksDb>(),
        di::bind<blockchain::BlockStorage>.to(sharedImpl<blockchain::BlockStorageImpl>()),
        di::bind<blockchain::BackfillDb>.to(sharedImpl<blockchain::BlockStorageImpl>()),
        di::bind<blockchain::BlobSidecarSource>.to(sharedImpl<blockchain::BlockStorageImpl>()),
        di::bind<blockchain::BackfillStatus>.to<blockchain::BackfillStatusImpl>(),
        di::bind<networking::RateLimiter>.to(sharedImpl<networking::RateLimiterImpl>()),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace histsync::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }

  std::shared_ptr<blockchain::BackfillStatus>
  NodeInjector::injectBackfillStatus() {
    return pimpl_->injector_
        .template create<std::shared_ptr<blockchain::BackfillStatus>>();
  }
}  // namespace histsync::injector
