/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace histsync::log {
  class LoggingSystem;
}  // namespace histsync::log

namespace histsync::app {
  class Configuration;
  class Application;
}  // namespace histsync::app

namespace histsync::blockchain {
  class BackfillStatus;
}  // namespace histsync::blockchain

namespace histsync::injector {

  /**
   * Dependency injector of the node. Provides all major components
   * required by the histsync application.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

    std::shared_ptr<blockchain::BackfillStatus> injectBackfillStatus();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace histsync::injector
